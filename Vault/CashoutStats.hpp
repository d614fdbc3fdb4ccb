#ifndef VAULT_CASHOUTSTATS_HPP
#define VAULT_CASHOUTSTATS_HPP

#include"Ledger/Amount.hpp"
#include<cstdint>

namespace Vault {

/** struct Vault::CashoutStats
 *
 * @brief the aggregate counters kept by the
 * cash-out service.
 */
struct CashoutStats {
	Ledger::Amount total_received_cashed;
	/* For the current UTC day.  */
	Ledger::Amount today_received_cashed;
	std::uint64_t total_received_cashed_count;

	CashoutStats() : total_received_cashed_count(0) { }
};

}

#endif /* !defined(VAULT_CASHOUTSTATS_HPP) */
