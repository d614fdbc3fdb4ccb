#ifndef VAULT_SIGNEDCHEQUE_HPP
#define VAULT_SIGNEDCHEQUE_HPP

#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"
#include<cstdint>
#include<vector>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Vault {

/** struct Vault::SignedCheque
 *
 * @brief an off-chain promise by the payer of a vault
 * that the beneficiary may redeem up to
 * `cumulative_payout` in total.
 *
 * @desc Successive cheques for the same vault and
 * beneficiary never decrease `cumulative_payout`.
 */
struct SignedCheque {
	Ledger::Address vault;
	Ledger::Address beneficiary;
	Ledger::Amount cumulative_payout;
	std::vector<std::uint8_t> signature;

	Json::Out json() const;
	/* Throws std::invalid_argument or Jsmn::TypeError.  */
	static SignedCheque object(Jsmn::Object const&);

	bool operator==(SignedCheque const& o) const {
		return vault == o.vault
		    && beneficiary == o.beneficiary
		    && cumulative_payout == o.cumulative_payout
		    && signature == o.signature
		     ;
	}
	bool operator!=(SignedCheque const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(VAULT_SIGNEDCHEQUE_HPP) */
