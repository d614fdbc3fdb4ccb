#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool finished;

	void throw_sqlite3(char const* src) {
		auto connection = (sqlite3*) db.get_connection();
		auto err = std::string(sqlite3_errmsg(connection));
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Tx: ") + src + ": " + err
		);
	}

	void finish(char const* cmd) {
		auto connection = (sqlite3*) db.get_connection();
		auto res = sqlite3_exec(connection, cmd, NULL, NULL, NULL);
		auto err = std::string();
		if (res != SQLITE_OK) {
			err = sqlite3_errmsg(connection);
			/* A failed COMMIT can leave the transaction
			 * open, and the next BEGIN would fail.  */
			if (!sqlite3_get_autocommit(connection))
				(void) sqlite3_exec( connection, "ROLLBACK"
						   , NULL, NULL, NULL
						   );
		}
		finished = true;
		db.transaction_finish();
		if (res != SQLITE_OK)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Tx: ") + cmd + ": " + err
			);
	}

public:
	Impl(Sqlite3::Db const& db_) : db(db_), finished(false) {
		auto connection = (sqlite3*) db.get_connection();
		auto res = sqlite3_exec(connection, "BEGIN", NULL, NULL, NULL);
		if (res != SQLITE_OK)
			throw_sqlite3("BEGIN");
	}

	~Impl() {
		if (finished)
			return;
		/* Not committed: discard.  A failed ROLLBACK
		 * leaves nothing committed either.  */
		auto connection = (sqlite3*) db.get_connection();
		(void) sqlite3_exec(connection, "ROLLBACK", NULL, NULL, NULL);
		db.transaction_finish();
	}

	void commit() { finish("COMMIT"); }
	void rollback() { finish("ROLLBACK"); }

	void query_execute(char const* q) {
		auto connection = (sqlite3*) db.get_connection();
		auto res = sqlite3_exec(connection, q, NULL, NULL, NULL);
		if (res != SQLITE_OK)
			throw_sqlite3(q);
	}

	Query query(char const* sql) {
		auto connection = (sqlite3*) db.get_connection();
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2( connection, sql, -1
					     , &stmt, nullptr
					     );
		if (res != SQLITE_OK)
			throw_sqlite3(sql);

		return Query(db, stmt);
	}
};

Tx::Tx(Sqlite3::Db const& db)
		: pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto my_pimpl = std::move(pimpl);
	my_pimpl->commit();
}
void Tx::rollback() {
	auto my_pimpl = std::move(pimpl);
	my_pimpl->rollback();
}

Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}

void Tx::query_execute(char const* q) {
	return pimpl->query_execute(q);
}

}
