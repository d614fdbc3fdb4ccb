#include"Sqlite3/Detail/columns.hpp"
#include<sqlite3.h>

namespace Sqlite3 { namespace Detail {

std::int64_t column_i(void* stmt, int c) {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c);
}
std::string column_s(void* vstmt, int c) {
	auto stmt = (sqlite3_stmt*) vstmt;
	/* Text first, then its length, as sqlite3 documents.  */
	auto dat = sqlite3_column_text(stmt, c);
	auto len = sqlite3_column_bytes(stmt, c);
	if (!dat)
		return std::string();
	return std::string((char const*) dat, std::size_t(len));
}

}}
