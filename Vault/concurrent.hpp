#ifndef VAULT_CONCURRENT_HPP
#define VAULT_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Vault {

/** Vault::concurrent
 *
 * @brief Like Ev::concurrent except that a failure
 * of the new greenthread is logged on the bus and
 * goes no further.
 *
 * @desc Schedules a new greenthread for launching
 * later.
 * Nothing the greenthread throws reaches the
 * greenthread that launched it.
 */
Ev::Io<void> concurrent(S::Bus& bus, Ev::Io<void>);

}

#endif /* !defined(VAULT_CONCURRENT_HPP) */
