#include"Jsmn/Object.hpp"
#include"Ledger/Receipt.hpp"
#include<stdexcept>

namespace {

bool parse_status(Jsmn::Object const& s) {
	if (s.is_boolean())
		return bool(s);
	if (s.is_number())
		return s.direct_text() == "1";
	if (s.is_string()) {
		auto str = std::string(s);
		if (str == "0x1" || str == "1")
			return true;
		if (str == "0x0" || str == "0")
			return false;
	}
	throw std::invalid_argument("Ledger::Receipt: bad status");
}

}

namespace Ledger {

Receipt Receipt::object(Jsmn::Object const& o) {
	if (!o.is_object() || !o.has("transactionHash") || !o.has("status"))
		throw std::invalid_argument("Ledger::Receipt: not a receipt");

	auto ret = Receipt();
	ret.tx_hash = Ledger::Hash::object(o["transactionHash"]);
	ret.success = parse_status(o["status"]);

	auto logs = o["logs"];
	if (logs.is_null())
		return ret;
	if (!logs.is_array())
		throw std::invalid_argument("Ledger::Receipt: logs not an array");
	for (auto l : logs) {
		auto ev = Ledger::Event();
		ev.address = Ledger::Address::object(l["address"]);
		ev.name = std::string(l["event"]);
		ev.args = l["args"];
		if (!ev.args.is_object())
			throw std::invalid_argument(
				"Ledger::Receipt: event args not an object"
			);
		ret.events.push_back(std::move(ev));
	}
	return ret;
}

}
