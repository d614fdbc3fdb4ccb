#ifndef VAULT_DBSTORE_HPP
#define VAULT_DBSTORE_HPP

#include"Sqlite3/Db.hpp"
#include"Vault/StoreIF.hpp"
#include<memory>

namespace Sqlite3 { class Tx; }

namespace Vault {

/** class Vault::DbStore
 *
 * @brief Vault::StoreIF kept in an sqlite3 database.
 *
 * @desc The table is created on first use.
 * Copies of the Sqlite3::Db share the connection, so
 * several stores (or other users) may share one db.
 */
class DbStore : public StoreIF {
private:
	Sqlite3::Db db;
	std::shared_ptr<bool> initialized;

	Ev::Io<Sqlite3::Tx> transact();
	Ev::Io<void> iterate_from( std::string const& prefix
				 , std::unique_ptr<std::string> after
				 , Visitor visitor
				 );

public:
	DbStore() =delete;
	explicit
	DbStore(Sqlite3::Db db_);

	Ev::Io<std::unique_ptr<std::string>> get(std::string const& key) override;
	Ev::Io<void> put(std::string const& key, std::string const& value) override;
	Ev::Io<void> iterate(std::string const& prefix, Visitor visitor) override;
};

}

#endif /* !defined(VAULT_DBSTORE_HPP) */
