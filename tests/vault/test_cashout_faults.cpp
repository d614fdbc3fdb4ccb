#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Ledger/errors.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Vault/CashOutResult.hpp"
#include"Vault/CashoutAction.hpp"
#include"Vault/CashoutService.hpp"
#include"Vault/CashoutStats.hpp"
#include"Vault/CashoutStatus.hpp"
#include"Vault/DbStore.hpp"
#include"Vault/Detail/counters.hpp"
#include"Vault/Mod/JsonOutputter.hpp"
#include"Vault/Msg/JsonCout.hpp"
#include"Vault/StoreIF.hpp"
#include"Vault/keys.hpp"
#include"MockEnv.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<set>
#include<sstream>
#include<stdexcept>
#include<string>

namespace {

auto const vA = Ledger::Address("0x00000000000000000000000000000000000000a1");
auto const vB = Ledger::Address("0x00000000000000000000000000000000000000b1");
auto const vC = Ledger::Address("0x00000000000000000000000000000000000000c1");
auto const ben = Ledger::Address("0x0000000000000000000000000000000000000bee");

/* Passes everything to another store, except that
 * writes to the chosen keys fail.  */
class FaultyStore : public Vault::StoreIF {
private:
	Vault::StoreIF& inner;

public:
	std::set<std::string> failing;

	explicit
	FaultyStore(Vault::StoreIF& inner_) : inner(inner_) { }

	Ev::Io<std::unique_ptr<std::string>>
	get(std::string const& key) override {
		return inner.get(key);
	}
	Ev::Io<void>
	put(std::string const& key, std::string const& value) override {
		if (failing.count(key) != 0)
			return Ev::yield().then([key]() {
				throw std::runtime_error("disk full writing " + key);
				return Ev::lift();
			});
		return inner.put(key, value);
	}
	Ev::Io<void>
	iterate(std::string const& prefix, Visitor visitor) override {
		return inner.iterate(prefix, std::move(visitor));
	}
};

}

int main() {
	auto bus = S::Bus();
	auto logs = std::ostringstream();
	auto outputter = Vault::Mod::JsonOutputter(logs, bus);
	auto db_store = Vault::DbStore(Sqlite3::Db(":memory:"));
	auto store = FaultyStore(db_store);
	auto env = MockEnv();
	auto service = Vault::CashoutService(bus, store, env, env, env);

	auto h = Ledger::Hash();

	auto code = Ev::lift().then([&]() {
		return service.count_uncashed_record(vA);
	}).then([&]() {
		return service.count_uncashed_record(vA);
	}).then([&]() {
		return service.count_uncashed_record(vA);
	}).then([&]() {

		/* The total count cannot be written.  */
		store.failing.insert(Vault::Key::total_received_cashed_count());
		env.give_cheque(vA, ben, 100);
		return service.cash_cheque(vA, ben);
	}).then([&](Ledger::Hash n_h) {
		h = n_h;
		env.mine(h, true, "[" + MockEnv::cashed(vA, ben, 100, 100) + "]");
		return result_of(service, vA, h);
	}).then([&](Vault::CashOutResult r) {
		/* Still recorded.  */
		assert(r.success);
		assert(r.amount == Ledger::Amount::units(100));
		return service.cashout_stats();
	}).then([&](Vault::CashoutStats stats) {
		assert(stats.total_received_cashed == Ledger::Amount::units(100));
		assert(stats.total_received_cashed_count == 0);
		return Vault::Detail::get_count(store, Vault::Key::peer_uncashed_count(vA));
	}).then([&](std::uint64_t n) {
		/* Kept for the next cash-out.  */
		assert(n == 3);
		assert(logs.str().find("updating uncashed record counts")
		       != std::string::npos);

		store.failing.clear();
		env.give_cheque(vA, ben, 150);
		return service.cash_cheque(vA, ben);
	}).then([&](Ledger::Hash n_h) {
		h = n_h;
		env.mine(h, true, "[" + MockEnv::cashed(vA, ben, 50, 150) + "]");
		return result_of(service, vA, h);
	}).then([&](Vault::CashOutResult r) {
		assert(r.success);
		assert(r.amount == Ledger::Amount::units(50));
		return service.cashout_stats();
	}).then([&](Vault::CashoutStats stats) {
		assert(stats.total_received_cashed == Ledger::Amount::units(150));
		assert(stats.total_received_cashed_count == 3);
		return Vault::Detail::get_count(store, Vault::Key::peer_uncashed_count(vA));
	}).then([&](std::uint64_t n) {
		assert(n == 0);

		/* Mined, but the vault emitted nothing.  */
		env.give_cheque(vB, ben, 70);
		return service.cash_cheque(vB, ben);
	}).then([&](Ledger::Hash n_h) {
		h = n_h;
		env.mine(h, true, "[]");
		return result_of(service, vB, h);
	}).then([&](Vault::CashOutResult r) {
		assert(!r.success);
		assert(r.amount == Ledger::Amount::units(70));
		return service.cashout_status(vB).then([](Vault::CashoutStatus) {
			return Ev::lift(false);
		}).catching<Ledger::EventNotFound>([](Ledger::EventNotFound const&) {
			return Ev::lift(true);
		});
	}).then([&](bool not_found) {
		assert(not_found);
		return service.cashout_stats();
	}).then([&](Vault::CashoutStats stats) {
		assert(stats.total_received_cashed == Ledger::Amount::units(150));
		assert(stats.total_received_cashed_count == 3);

		/* Logging the submission fails after the
		 * transaction went out.  */
		bus.subscribe<Vault::Msg::JsonCout>([](Vault::Msg::JsonCout const& m) {
			if (m.obj.output().find("cashing out cheque") != std::string::npos)
				throw std::runtime_error("log sink failed");
			return Ev::lift();
		});
		env.give_cheque(vC, ben, 40);
		return service.cash_cheque(vC, ben).then([](Ledger::Hash) {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			assert(std::string(e.what()) == "log sink failed");
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);
		return store.get(Vault::Key::cashout_action(vC));
	}).then([&](std::unique_ptr<std::string> raw) {
		assert(raw);
		auto action = Vault::CashoutAction::object(
			Jsmn::Object::parse_json(*raw)
		);
		h = action.tx_hash;
		env.mine(h, true, "[" + MockEnv::cashed(vC, ben, 40, 40) + "]");
		/* The cash-out is still followed.  */
		return result_of(service, vC, h);
	}).then([&](Vault::CashOutResult r) {
		assert(r.success);
		assert(r.amount == Ledger::Amount::units(40));
		return service.cashout_stats();
	}).then([&](Vault::CashoutStats stats) {
		assert(stats.total_received_cashed == Ledger::Amount::units(190));
		return Ev::lift(0);
	});

	return Ev::start(code);
}
