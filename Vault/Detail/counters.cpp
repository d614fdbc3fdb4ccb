#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Json/Out.hpp"
#include"Ledger/Amount.hpp"
#include"Vault/Detail/counters.hpp"
#include"Vault/StoreIF.hpp"
#include"Vault/errors.hpp"
#include<sstream>

namespace {

/* Digits of the stored counter, "0" if absent.  */
std::string decode( std::string const& key
		  , std::unique_ptr<std::string> const& value
		  ) {
	if (!value)
		return "0";
	auto js = Jsmn::Object();
	try {
		js = Jsmn::Object::parse_json(*value);
	} catch (Jsmn::ParseError const& e) {
		throw Vault::RecordDecodeError(key, e.what());
	}
	if (!js.is_string() || !Ledger::Amount::valid_string(std::string(js)))
		throw Vault::RecordDecodeError(key, "not a counter: " + *value);
	return std::string(js);
}
std::string encode(std::string const& digits) {
	return Json::Out::scalar(digits).output();
}

}

namespace Vault { namespace Detail {

Ev::Io<Ledger::Amount> get_amount(Vault::StoreIF& store, std::string const& key) {
	return store.get(key).then([key](std::unique_ptr<std::string> value) {
		return Ev::lift(Ledger::Amount(decode(key, value)));
	});
}
Ev::Io<void> put_amount( Vault::StoreIF& store, std::string const& key
		       , Ledger::Amount const& amount
		       ) {
	return store.put(key, encode(std::string(amount)));
}
Ev::Io<void> add_amount( Vault::StoreIF& store, std::string const& key
		       , Ledger::Amount const& amount
		       ) {
	auto pstore = &store;
	return get_amount(store, key).then([pstore, key, amount](Ledger::Amount prev) {
		return put_amount(*pstore, key, prev + amount);
	});
}

Ev::Io<std::uint64_t> get_count(Vault::StoreIF& store, std::string const& key) {
	return store.get(key).then([key](std::unique_ptr<std::string> value) {
		auto digits = decode(key, value);
		auto is = std::istringstream(digits);
		auto count = std::uint64_t(0);
		is >> count;
		if (is.fail())
			throw Vault::RecordDecodeError(key, "count out of range");
		return Ev::lift(count);
	});
}
Ev::Io<void> put_count( Vault::StoreIF& store, std::string const& key
		      , std::uint64_t count
		      ) {
	auto os = std::ostringstream();
	os << count;
	return store.put(key, encode(os.str()));
}

}}
