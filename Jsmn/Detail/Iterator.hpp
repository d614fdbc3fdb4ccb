#ifndef JSMN_DETAIL_ITERATOR_HPP
#define JSMN_DETAIL_ITERATOR_HPP

#include<memory>
#include<utility>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Object; }

namespace Jsmn { namespace Detail {

/* Walks the elements of a parsed array, skipping
 * over each element's own tokens.  */
class Iterator {
private:
	std::shared_ptr<Detail::ParseResult> r;
	unsigned int i;

	friend class Jsmn::Object;

	Iterator( std::shared_ptr<Detail::ParseResult> r_
		, unsigned int i_
		) : r(std::move(r_)), i(i_) { }

public:
	Iterator() =delete;

	bool operator!=(Iterator const& o) const {
		return r != o.r || i != o.i;
	}
	Iterator& operator++();
	Jsmn::Object operator*() const;
};

}}

#endif /* !defined(JSMN_DETAIL_ITERATOR_HPP) */
