#include"Jsmn/Detail/Token.hpp"

namespace Jsmn { namespace Detail {

void Token::next(Token const*& tokptr) {
	auto children = tokptr->size;
	++tokptr;
	for (auto i = 0; i < children; ++i)
		next(tokptr);
}

}}
