#ifndef VAULT_CASHOUTRESULT_HPP
#define VAULT_CASHOUTRESULT_HPP

#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"
#include"Ledger/Hash.hpp"
#include<cstdint>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Vault {

/** struct Vault::CashOutResult
 *
 * @brief the persisted outcome of the last finalized
 * cash-out of a vault.
 *
 * @desc Stored with status "success" or "fail"; a
 * result is "fail" unless the transaction was
 * confirmed.
 */
struct CashOutResult {
	Ledger::Hash tx_hash;
	Ledger::Address vault;
	Ledger::Amount amount;
	/* Unix time of finalization.  */
	std::int64_t cash_time;
	bool success;

	CashOutResult() : cash_time(0), success(false) { }

	Json::Out json() const;
	static CashOutResult object(Jsmn::Object const&);

	bool operator==(CashOutResult const& o) const {
		return tx_hash == o.tx_hash
		    && vault == o.vault
		    && amount == o.amount
		    && cash_time == o.cash_time
		    && success == o.success
		     ;
	}
	bool operator!=(CashOutResult const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(VAULT_CASHOUTRESULT_HPP) */
