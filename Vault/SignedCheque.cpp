#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/Str.hpp"
#include"Vault/SignedCheque.hpp"

namespace Vault {

Json::Out SignedCheque::json() const {
	return Json::Out()
		.start_object()
			.field("vault", std::string(vault))
			.field("beneficiary", std::string(beneficiary))
			.field("cumulative_payout", std::string(cumulative_payout))
			.field("signature", Util::Str::hexdump( signature.data()
							      , signature.size()
							      ))
		.end_object()
		;
}

SignedCheque SignedCheque::object(Jsmn::Object const& o) {
	auto ret = SignedCheque();
	ret.vault = Ledger::Address::object(o["vault"]);
	ret.beneficiary = Ledger::Address::object(o["beneficiary"]);
	ret.cumulative_payout = Ledger::Amount::object(o["cumulative_payout"]);
	ret.signature = Util::Str::hexread(std::string(o["signature"]));
	return ret;
}

}
