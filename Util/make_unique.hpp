#ifndef UTIL_MAKE_UNIQUE_HPP
#define UTIL_MAKE_UNIQUE_HPP

#include<memory>
#include<type_traits>
#include<utility>

namespace Util {

/** Util::make_unique
 *
 * @brief `std::make_unique` for single objects.
 * Arrays are not supported.
 */
template<typename T, typename... As>
::std::unique_ptr<T> make_unique(As&&... as) {
	static_assert( !::std::is_array<T>::value
		     , "Util::make_unique does not create arrays"
		     );
	return ::std::unique_ptr<T>(new T(::std::forward<As>(as)...));
}

}

#endif /* !defined(UTIL_MAKE_UNIQUE_HPP) */
