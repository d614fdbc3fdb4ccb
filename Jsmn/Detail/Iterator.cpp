#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

Iterator& Iterator::operator++() {
	Token const* tok = &r->tokens[i];
	auto after = tok;
	Token::next(after);
	i += (after - tok);
	return *this;
}
Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(r, i);
}

}}
