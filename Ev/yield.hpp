#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets other greenthreads run before this one
 * continues.
 *
 * @desc Store state read before a yield may have
 * changed after it.
 * yield(n) yields n times; tests use it to let
 * background finalizers get ahead.
 */
Ev::Io<void> yield();
Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
