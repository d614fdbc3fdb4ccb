#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Vault/CashOutResult.hpp"
#include<stdexcept>

namespace Vault {

Json::Out CashOutResult::json() const {
	return Json::Out()
		.start_object()
			.field("tx_hash", std::string(tx_hash))
			.field("vault", std::string(vault))
			.field("amount", std::string(amount))
			.field("cash_time", cash_time)
			.field("status", std::string(success ? "success" : "fail"))
		.end_object()
		;
}

CashOutResult CashOutResult::object(Jsmn::Object const& o) {
	auto ret = CashOutResult();
	ret.tx_hash = Ledger::Hash::object(o["tx_hash"]);
	ret.vault = Ledger::Address::object(o["vault"]);
	ret.amount = Ledger::Amount::object(o["amount"]);
	ret.cash_time = std::int64_t(double(o["cash_time"]));
	auto status = std::string(o["status"]);
	if (status == "success")
		ret.success = true;
	else if (status == "fail")
		ret.success = false;
	else
		throw std::invalid_argument(
			"Vault::CashOutResult: unknown status " + status
		);
	return ret;
}

}
