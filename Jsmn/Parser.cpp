#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Detail/Type.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Util/make_unique.hpp"
#include<cctype>
#include<sstream>
#include<vector>

/* jsmn has all its code in the jsmn.h header, so instantiate all its
 * code into this compilation unit.
 */
#define JSMN_STATIC 1		/* Everything in this compilation unit.  */
#undef JSMN_HEADER		/* Not header-only.  */
#define JSMN_PARENT_LINKS 1	/* Faster parsing for more memory use.  */
#define JSMN_STRICT 1		/* Reject sloppy JSON.  */
# include<jsmn.h>

namespace {

/* Convert from jsmn.h types to Jsmn::Detail::Type.  */
Jsmn::Detail::Type type_convert(jsmntype_t t) {
	switch (t) {
	case JSMN_UNDEFINED: return Jsmn::Detail::Undefined;
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	}
	return Jsmn::Detail::Undefined;
}
/* Convert from jsmn.h tokens to Jsmn::Detail::Token.  */
Jsmn::Detail::Token token_convert(jsmntok_t const& tok) {
	auto ret = Jsmn::Detail::Token();
	ret.type = type_convert(tok.type);
	ret.start = tok.start;
	ret.end = tok.end;
	ret.size = tok.size;
	return ret;
}

bool all_space(std::string const& s, std::size_t from) {
	for (auto i = from; i < s.size(); ++i)
		if (!isspace((unsigned char) s[i]))
			return false;
	return true;
}

}

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	auto os = std::ostringstream();
	os << "Jsmn::ParseError: at position " << i << " of: " << input;
	return os.str();
}

class Parser::Impl {
private:
	std::vector<jsmntok_t> toks;

public:
	Impl() : toks(16) { }

	std::shared_ptr<Detail::ParseResult> parse(std::string const& s) {
		for (;;) {
			auto base = jsmn_parser();
			jsmn_init(&base);
			auto res = jsmn_parse( &base
					     , s.c_str(), s.size()
					     , &toks[0], toks.size()
					     );
			if (res == JSMN_ERROR_NOMEM) {
				toks.resize(toks.size() * 2);
				continue;
			}
			if (res <= 0)
				throw ParseError(s, base.pos);
			/* Only one datum per document.  */
			if (toks[0].end < 0 || !all_space(s, std::size_t(toks[0].end)))
				throw ParseError(s, base.pos);
			auto pr = std::make_shared<Detail::ParseResult>();
			pr->orig_string = s;
			pr->tokens.resize(res);
			for (auto i = 0; i < res; ++i)
				pr->tokens[i] = token_convert(toks[i]);
			/* A second top-level primitive also shows up
			 * as an extra token after the first datum.  */
			Detail::Token const* covered = &pr->tokens[0];
			Detail::Token::next(covered);
			if (covered != &pr->tokens[0] + res)
				throw ParseError(s, base.pos);
			return pr;
		}
	}
};

Parser::Parser() : pimpl(Util::make_unique<Impl>()) { }
Parser::~Parser() { }

Jsmn::Object Parser::parse(std::string const& s) {
	return Jsmn::Object(pimpl->parse(s), 0);
}

}
