#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Vault/CashoutAction.hpp"

namespace Vault {

Json::Out CashoutAction::json() const {
	return Json::Out()
		.start_object()
			.field("tx_hash", std::string(tx_hash))
			.field("cheque", cheque.json())
		.end_object()
		;
}

CashoutAction CashoutAction::object(Jsmn::Object const& o) {
	auto ret = CashoutAction();
	ret.tx_hash = Ledger::Hash::object(o["tx_hash"]);
	ret.cheque = Vault::SignedCheque::object(o["cheque"]);
	return ret;
}

}
