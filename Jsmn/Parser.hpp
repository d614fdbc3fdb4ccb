#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>

namespace Jsmn { class Object; }

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief jsmn-based parser for complete JSON documents.
 *
 * @desc Each `parse` call must be given exactly one
 * whole JSON datum, optionally surrounded by
 * whitespace.
 * jsmn runs in strict mode, where a bare top-level
 * number, boolean or null is rejected; the datum
 * must be an object, array or string.
 * The token buffer is kept between calls, so a
 * single parser is cheaper when parsing many
 * documents.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Parser();
	~Parser();

	Parser(Parser const&) =delete;
	Parser(Parser&&) =delete;

	/* Throws Jsmn::ParseError on malformed, truncated,
	 * empty or trailing input.  */
	Jsmn::Object parse(std::string const& s);
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
