#ifndef VAULT_DETAIL_PARSE_CASH_CHEQUE_RECEIPT_HPP
#define VAULT_DETAIL_PARSE_CASH_CHEQUE_RECEIPT_HPP

namespace Ledger { class Address; }
namespace Ledger { struct Receipt; }
namespace Vault { struct CashChequeResult; }

namespace Vault { namespace Detail {

/** Vault::Detail::parse_cash_cheque_receipt
 *
 * @brief decodes what a confirmed cash-out did from
 * the events the vault emitted.
 *
 * @desc Requires exactly one ChequeCashed event from
 * the vault, else throws Ledger::EventNotFound or
 * Ledger::EventDecodeAmbiguous.
 * A single ChequeBounced event marks the result as
 * bounced; more than one is Ledger::EventDecodeAmbiguous.
 * Malformed arguments throw Vault::AbiDecodeError.
 */
Vault::CashChequeResult
parse_cash_cheque_receipt( Ledger::Address const& vault
			 , Ledger::Receipt const& receipt
			 );

}}

#endif /* !defined(VAULT_DETAIL_PARSE_CASH_CHEQUE_RECEIPT_HPP) */
