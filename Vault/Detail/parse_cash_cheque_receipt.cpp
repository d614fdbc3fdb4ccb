#include"Jsmn/Object.hpp"
#include"Ledger/Receipt.hpp"
#include"Ledger/errors.hpp"
#include"Ledger/find_single_event.hpp"
#include"Vault/Abi.hpp"
#include"Vault/CashChequeResult.hpp"
#include"Vault/Detail/parse_cash_cheque_receipt.hpp"
#include"Vault/errors.hpp"
#include<stdexcept>

namespace {

Ledger::Address get_address(Jsmn::Object const& args, char const* name) {
	auto v = args[name];
	if (!v.is_string() || !Ledger::Address::valid_string(std::string(v)))
		throw Vault::AbiDecodeError(
			std::string("ChequeCashed: bad address ") + name
		);
	return Ledger::Address(std::string(v));
}
Ledger::Amount get_amount(Jsmn::Object const& args, char const* name) {
	auto v = args[name];
	if (!Ledger::Amount::valid_object(v))
		throw Vault::AbiDecodeError(
			std::string("ChequeCashed: bad amount ") + name
		);
	return Ledger::Amount::object(v);
}

}

namespace Vault { namespace Detail {

Vault::CashChequeResult
parse_cash_cheque_receipt( Ledger::Address const& vault
			 , Ledger::Receipt const& receipt
			 ) {
	auto const& cashed = Ledger::find_single_event( receipt, vault
						      , Abi::cheque_cashed_event
						      );
	auto const& args = cashed.args;

	auto ret = Vault::CashChequeResult();
	ret.beneficiary = get_address(args, "beneficiary");
	ret.recipient = get_address(args, "recipient");
	ret.caller = get_address(args, "caller");
	ret.total_payout = get_amount(args, "totalPayout");
	ret.cumulative_payout = get_amount(args, "cumulativePayout");
	ret.caller_payout = get_amount(args, "callerPayout");

	try {
		(void) Ledger::find_single_event( receipt, vault
						, Abi::cheque_bounced_event
						);
		ret.bounced = true;
	} catch (Ledger::EventNotFound const&) {
		ret.bounced = false;
	}

	return ret;
}

}}
