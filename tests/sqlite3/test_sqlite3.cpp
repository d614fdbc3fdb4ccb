#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<stdexcept>

int main() {
	auto db = Sqlite3::Db(":memory:");

	auto in_flight = 0;
	auto max_in_flight = 0;
	auto empty_transaction = [&]() {
		return db.transact().then([&](Sqlite3::Tx tx) {
			++in_flight;
			if (in_flight > max_in_flight)
				max_in_flight = in_flight;
			auto ptx = std::make_shared<Sqlite3::Tx>(std::move(tx));
			return Ev::yield().then([&, ptx]() {
				--in_flight;
				ptx->commit();
				return Ev::lift();
			});
		});
	};

	auto count_rows = [&]() {
		return db.transact().then([&](Sqlite3::Tx tx) {
			auto res = tx.query("SELECT COUNT(*) FROM \"foo\";")
				.execute()
				;
			auto count = 0;
			for (auto& r : res)
				count = r.get<int>(0);
			tx.commit();
			return Ev::lift(count);
		});
	};

	auto code = Ev::lift().then([&]() {

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.rollback();
		assert(!tx);

		/* Transactions are exclusive.  */
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::yield(20);
	}).then([&]() {
		assert(in_flight == 0);
		assert(max_in_flight == 1);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("CREATE TABLE \"foo\" (c1 INTEGER, c2 TEXT, c3 INTEGER);");
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("INSERT INTO \"foo\" VALUES(:c1, :c2, :c3)")
			.bind(":c1", std::int64_t(1) << 40)
			.bind(":c2", std::string("some text"))
			.bind(":c3", true)
			.execute()
			;
		for (auto& r : res) {
			(void) r;
			/* Should have empty result!  */
			assert(false);
		}
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("SELECT c1, c2, c3 FROM \"foo\"")
			.execute()
			;
		auto flag = false;
		for (auto& r : res) {
			assert(!flag);
			flag = true;
			assert(r.get<std::int64_t>(0) == (std::int64_t(1) << 40));
			assert(r.get<std::string>(1) == "some text");
			assert(r.get<bool>(2));
		}
		assert(flag);
		tx.commit();

		/* A transaction dropped without commit
		 * rolls back.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query("INSERT INTO \"foo\" VALUES(2, 'dropped', 0)")
			.execute()
			;
		return Ev::lift();
	}).then([&]() {
		return count_rows();
	}).then([&](int count) {
		assert(count == 1);

		/* Bad SQL throws.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto thrown = false;
		try {
			tx.query_execute("SELECT * FROM \"nonexistent\";");
		} catch (std::runtime_error const&) {
			thrown = true;
		}
		assert(thrown);
		tx.rollback();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
