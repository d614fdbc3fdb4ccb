#ifndef VAULT_CASHCHEQUERESULT_HPP
#define VAULT_CASHCHEQUERESULT_HPP

#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"

namespace Vault {

/** struct Vault::CashChequeResult
 *
 * @brief what a confirmed cash-out transaction did,
 * as reported by the vault's events.
 */
struct CashChequeResult {
	Ledger::Address beneficiary;
	Ledger::Address recipient;
	Ledger::Address caller;
	/* Paid out by this transaction.  */
	Ledger::Amount total_payout;
	/* Paid out by the vault so far, this one included.  */
	Ledger::Amount cumulative_payout;
	Ledger::Amount caller_payout;
	/* The vault could not cover the whole cheque.  */
	bool bounced;

	CashChequeResult() : bounced(false) { }

	bool operator==(CashChequeResult const& o) const {
		return beneficiary == o.beneficiary
		    && recipient == o.recipient
		    && caller == o.caller
		    && total_payout == o.total_payout
		    && cumulative_payout == o.cumulative_payout
		    && caller_payout == o.caller_payout
		    && bounced == o.bounced
		     ;
	}
	bool operator!=(CashChequeResult const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(VAULT_CASHCHEQUERESULT_HPP) */
