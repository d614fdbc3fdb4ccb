#ifndef JSMN_DETAIL_TOKEN_HPP
#define JSMN_DETAIL_TOKEN_HPP

#include"Jsmn/Detail/Type.hpp"

namespace Jsmn { namespace Detail {

struct Token {
	Type type;
	int start;
	int end;
	/* Elements of an array, keys of an object,
	 * 1 for an object key, else 0.  */
	int size;

	/* Advances past the given token and everything
	 * nested inside it.  */
	static void next(Token const*& tokptr);
};

}}

#endif /* !defined(JSMN_DETAIL_TOKEN_HPP) */
