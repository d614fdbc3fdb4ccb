#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ledger/Amount.hpp"
#include"Sqlite3.hpp"
#include"Vault/DbStore.hpp"
#include"Vault/Detail/counters.hpp"
#include"Vault/errors.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto store = Vault::DbStore(db);
	auto seen = std::vector<std::string>();

	auto visit_all = [&](std::string const& prefix) {
		seen.clear();
		return store.iterate(prefix, [&]( std::string const& key
						, std::string const& value
						) {
			seen.push_back(key + "=" + value);
			return Ev::lift(false);
		});
	};

	auto code = Ev::lift().then([&]() {
		return store.get("nothing");
	}).then([&](std::unique_ptr<std::string> v) {
		assert(!v);

		return store.put("a_2", "\"two\"");
	}).then([&]() {
		return store.put("a_1", "\"one\"");
	}).then([&]() {
		return store.put("b_1", "\"other\"");
	}).then([&]() {
		return store.put("a_2", "\"TWO\"");
	}).then([&]() {
		return store.get("a_2");
	}).then([&](std::unique_ptr<std::string> v) {
		assert(v);
		assert(*v == "\"TWO\"");

		/* Prefix, in key order.  */
		return visit_all("a_");
	}).then([&]() {
		assert(seen.size() == 2);
		assert(seen[0] == "a_1=\"one\"");
		assert(seen[1] == "a_2=\"TWO\"");

		return visit_all("c_");
	}).then([&]() {
		assert(seen.empty());

		/* "_" is not a LIKE wildcard here.  */
		return store.put("aX1", "{}");
	}).then([&]() {
		return visit_all("a_");
	}).then([&]() {
		assert(seen.size() == 2);

		/* Stopping early, and writing while iterating.  */
		seen.clear();
		return store.iterate("a_", [&]( std::string const& key
					      , std::string const& value
					      ) {
			seen.push_back(key);
			return store.put("a_0", "\"late\"").then([]() {
				return Ev::lift(true);
			});
		});
	}).then([&]() {
		assert(seen.size() == 1);
		assert(seen[0] == "a_1");

		return visit_all("a_");
	}).then([&]() {
		assert(seen.size() == 3);
		assert(seen[0] == "a_0=\"late\"");

		/* Counters.  */
		return Vault::Detail::get_amount(store, "amount");
	}).then([&](Ledger::Amount a) {
		assert(a == Ledger::Amount());
		return Vault::Detail::add_amount( store, "amount"
						, Ledger::Amount("18446744073709551615")
						);
	}).then([&]() {
		return Vault::Detail::add_amount(store, "amount", Ledger::Amount::units(1));
	}).then([&]() {
		return Vault::Detail::get_amount(store, "amount");
	}).then([&](Ledger::Amount a) {
		assert(a == Ledger::Amount("18446744073709551616"));
		return store.get("amount");
	}).then([&](std::unique_ptr<std::string> v) {
		assert(*v == "\"18446744073709551616\"");

		return Vault::Detail::get_count(store, "count");
	}).then([&](std::uint64_t n) {
		assert(n == 0);
		return Vault::Detail::put_count(store, "count", 7);
	}).then([&]() {
		return Vault::Detail::get_count(store, "count");
	}).then([&](std::uint64_t n) {
		assert(n == 7);

		/* A malformed counter is an error, not zero.  */
		return store.put("count", "{\"x\": 1}");
	}).then([&]() {
		return Vault::Detail::get_count(store, "count").then([](std::uint64_t) {
			return Ev::lift(false);
		}).catching<Vault::RecordDecodeError>([](Vault::RecordDecodeError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool thrown) {
		assert(thrown);

		/* Another store on the same db sees the data.  */
		auto other = std::make_shared<Vault::DbStore>(db);
		return other->get("a_1").then([other](std::unique_ptr<std::string> v) {
			assert(v);
			assert(*v == "\"one\"");
			return Ev::lift(0);
		});
	});

	return Ev::start(code);
}
