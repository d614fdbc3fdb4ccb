#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"
#include"Ledger/TxRequest.hpp"
#include"Util/Str.hpp"
#include"Vault/Abi.hpp"
#include"Vault/errors.hpp"
#include<sstream>

namespace Vault { namespace Abi {

char const* const cheque_cashed_event = "ChequeCashed";
char const* const cheque_bounced_event = "ChequeBounced";

Ledger::TxRequest paid_out( Ledger::Address const& vault
			  , Ledger::Address const& beneficiary
			  ) {
	auto req = Ledger::TxRequest();
	req.to = vault;
	req.method = "paidOut";
	req.params = Json::Out()
		.start_array()
			.entry(std::string(beneficiary))
		.end_array()
		;
	req.description = "paid out query";
	return req;
}

Ledger::Amount decode_paid_out(Jsmn::Object const& outputs) {
	if (!outputs.is_array())
		throw AbiDecodeError("paidOut: outputs not an array");
	if (outputs.size() != 1) {
		auto os = std::ostringstream();
		os << "paidOut: expected 1 output, got " << outputs.size();
		throw AbiDecodeError(os.str());
	}
	auto out = outputs[std::size_t(0)];
	if (!Ledger::Amount::valid_object(out))
		throw AbiDecodeError("paidOut: output not an amount");
	return Ledger::Amount::object(out);
}

Ledger::TxRequest
cash_cheque_beneficiary( Ledger::Address const& vault
		       , Ledger::Address const& recipient
		       , Ledger::Amount const& cumulative_payout
		       , std::vector<std::uint8_t> const& signature
		       ) {
	auto req = Ledger::TxRequest();
	req.to = vault;
	req.method = "cashChequeBeneficiary";
	req.params = Json::Out()
		.start_array()
			.entry(std::string(recipient))
			.entry(std::string(cumulative_payout))
			.entry("0x" + Util::Str::hexdump( signature.data()
							, signature.size()
							))
		.end_array()
		;
	req.value = Ledger::Amount();
	req.description = "cheque cashout";
	return req;
}

}}
