#ifndef VAULT_ABI_HPP
#define VAULT_ABI_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Ledger { class Address; }
namespace Ledger { class Amount; }
namespace Ledger { struct TxRequest; }

/* The vault contract's methods and events, by name.  */
namespace Vault { namespace Abi {

extern char const* const cheque_cashed_event;
extern char const* const cheque_bounced_event;

/** Vault::Abi::paid_out
 *
 * @brief read-only call for the amount the vault has
 * paid to the beneficiary so far.
 */
Ledger::TxRequest paid_out( Ledger::Address const& vault
			  , Ledger::Address const& beneficiary
			  );
/** Vault::Abi::decode_paid_out
 *
 * @brief decodes the outputs of a paid_out call.
 *
 * @desc Throws Vault::AbiDecodeError unless the
 * outputs are exactly one amount.
 */
Ledger::Amount decode_paid_out(Jsmn::Object const& outputs);

/** Vault::Abi::cash_cheque_beneficiary
 *
 * @brief transaction cashing a cheque out to the
 * recipient.
 */
Ledger::TxRequest
cash_cheque_beneficiary( Ledger::Address const& vault
		       , Ledger::Address const& recipient
		       , Ledger::Amount const& cumulative_payout
		       , std::vector<std::uint8_t> const& signature
		       );

}}

#endif /* !defined(VAULT_ABI_HPP) */
