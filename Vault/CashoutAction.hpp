#ifndef VAULT_CASHOUTACTION_HPP
#define VAULT_CASHOUTACTION_HPP

#include"Ledger/Hash.hpp"
#include"Vault/SignedCheque.hpp"

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Vault {

/** struct Vault::CashoutAction
 *
 * @brief the last cash-out submitted for a vault:
 * the transaction and the cheque it carried.
 *
 * @desc One per vault; a later submission replaces it.
 */
struct CashoutAction {
	Ledger::Hash tx_hash;
	Vault::SignedCheque cheque;

	Json::Out json() const;
	static CashoutAction object(Jsmn::Object const&);
};

}

#endif /* !defined(VAULT_CASHOUTACTION_HPP) */
