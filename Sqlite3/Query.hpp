#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/binds.hpp"
#include<memory>
#include<string>
#include<utility>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement inside a Sqlite3::Tx.
 *
 * @desc Bind the named parameters, then execute
 * once.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	void* get_stmt() const;
	int get_location(char const*) const;

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	/* field is ":name"; throws if the statement has
	 * no such parameter.  */
	template<typename a>
	Query& bind(char const* field, a value) {
		Detail::Bind<a>::bind( get_stmt(), get_location(field)
				     , std::move(value)
				     );
		return *this;
	}

	/* Unbound parameters are NULL.  The query cannot
	 * be executed again.  */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
