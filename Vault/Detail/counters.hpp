#ifndef VAULT_DETAIL_COUNTERS_HPP
#define VAULT_DETAIL_COUNTERS_HPP

#include<cstdint>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Amount; }
namespace Vault { class StoreIF; }

/* Counters in the store are JSON strings of decimal
 * digits.  An absent counter reads as zero.
 * Throws Vault::RecordDecodeError on a malformed one.
 */
namespace Vault { namespace Detail {

Ev::Io<Ledger::Amount> get_amount(Vault::StoreIF& store, std::string const& key);
Ev::Io<void> put_amount( Vault::StoreIF& store, std::string const& key
		       , Ledger::Amount const& amount
		       );
/* Read-then-write; not atomic.  */
Ev::Io<void> add_amount( Vault::StoreIF& store, std::string const& key
		       , Ledger::Amount const& amount
		       );

Ev::Io<std::uint64_t> get_count(Vault::StoreIF& store, std::string const& key);
Ev::Io<void> put_count( Vault::StoreIF& store, std::string const& key
		      , std::uint64_t count
		      );

}}

#endif /* !defined(VAULT_DETAIL_COUNTERS_HPP) */
