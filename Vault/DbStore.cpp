#include"Ev/Io.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include"Vault/DbStore.hpp"
#include<utility>

namespace {

typedef std::pair<std::string, std::string> Entry;

}

namespace Vault {

DbStore::DbStore(Sqlite3::Db db_)
	: db(std::move(db_))
	, initialized(std::make_shared<bool>(false))
	{ }

Ev::Io<Sqlite3::Tx> DbStore::transact() {
	if (*initialized)
		return db.transact();
	auto my_db = db;
	auto init = initialized;
	return db.transact().then([my_db, init](Sqlite3::Tx tx) mutable {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "VaultStore"
		     ( key TEXT PRIMARY KEY
		     , value TEXT NOT NULL
		     );
		)QRY");
		tx.commit();
		*init = true;
		return my_db.transact();
	});
}

Ev::Io<std::unique_ptr<std::string>> DbStore::get(std::string const& key) {
	return transact().then([key](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT value FROM "VaultStore"
		 WHERE key = :key;
		)QRY")
			.bind(":key", key)
			.execute()
			;
		auto ret = std::unique_ptr<std::string>();
		for (auto& r : fetch)
			ret = Util::make_unique<std::string>(r.get<std::string>(0));
		tx.commit();
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<void> DbStore::put(std::string const& key, std::string const& value) {
	return transact().then([key, value](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT OR REPLACE INTO "VaultStore"
		VALUES(:key, :value);
		)QRY")
			.bind(":key", key)
			.bind(":value", value)
			.execute()
			;
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<void> DbStore::iterate(std::string const& prefix, Visitor visitor) {
	return iterate_from(prefix, nullptr, std::move(visitor));
}

/* One row per transaction, so that the visitor can use
 * the store without waiting on us.  */
Ev::Io<void>
DbStore::iterate_from( std::string const& prefix
		     , std::unique_ptr<std::string> after
		     , Visitor visitor
		     ) {
	auto pafter = std::shared_ptr<std::string>(std::move(after));
	return transact().then([prefix, pafter](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT key, value FROM "VaultStore"
		 WHERE substr(key, 1, length(:prefix)) = :prefix
		   AND (:first OR key > :after)
		 ORDER BY key
		 LIMIT 1;
		)QRY")
			.bind(":prefix", prefix)
			.bind(":first", !pafter)
			.bind(":after", pafter ? *pafter : std::string())
			.execute()
			;
		auto found = std::unique_ptr<Entry>();
		for (auto& r : fetch)
			found = Util::make_unique<Entry>( r.get<std::string>(0)
							, r.get<std::string>(1)
							);
		tx.commit();
		return Ev::lift(std::move(found));
	}).then([this, prefix, visitor](std::unique_ptr<Entry> found) {
		if (!found)
			return Ev::lift();
		auto key = found->first;
		return visitor(found->first, found->second).then([ this
								 , prefix
								 , visitor
								 , key
								 ](bool stop) {
			if (stop)
				return Ev::lift();
			return iterate_from( prefix
					   , Util::make_unique<std::string>(key)
					   , visitor
					   );
		});
	});
}

}
