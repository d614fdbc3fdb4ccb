#ifndef VAULT_CASHOUTSTATUS_HPP
#define VAULT_CASHOUTSTATUS_HPP

#include"Ledger/Amount.hpp"
#include"Ledger/Hash.hpp"
#include"Vault/CashChequeResult.hpp"
#include"Vault/SignedCheque.hpp"
#include<memory>

namespace Vault {

/** struct Vault::LastCashout
 *
 * @brief the live state of the last submitted
 * cash-out of a vault.
 *
 * @desc `result` is set only once the transaction is
 * confirmed; `reverted` only if it failed.
 * Neither means it is still pending.
 */
struct LastCashout {
	Ledger::Hash tx_hash;
	Vault::SignedCheque cheque;
	std::unique_ptr<Vault::CashChequeResult> result;
	bool reverted;

	LastCashout() : reverted(false) { }
};

/** struct Vault::CashoutStatus
 *
 * @brief point-in-time view of how much of the latest
 * cheque of a vault is still unredeemed.
 *
 * @desc `last` is nullptr if the vault was never
 * cashed out.
 * Never persisted.
 */
struct CashoutStatus {
	std::unique_ptr<Vault::LastCashout> last;
	Ledger::Amount uncashed_amount;
};

}

#endif /* !defined(VAULT_CASHOUTSTATUS_HPP) */
