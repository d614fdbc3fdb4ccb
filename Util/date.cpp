#include"Util/date.hpp"
#include<cstdint>
#include<inttypes.h>
#include<math.h>
#include<stdio.h>
#include<time.h>

#if HAVE_GMTIME_R
#define GMTIME_R gmtime_r
#else /* !HAVE_GMTIME_R */
#define GMTIME_R my_gmtime_r
namespace {

/* Emulate with the non-reentrant gmtime.
 * Any `Ev::Io` program is single-threaded.
 */
struct tm* my_gmtime_r(const time_t* ptime, struct tm* result) {
	auto staticres = gmtime(ptime);
	*result = *staticres;
	return result;
}

}
#endif

namespace {

std::string strftime_utc(time_t seconds, char const* tpl) {
	auto split = tm();
	(void) GMTIME_R(&seconds, &split);

	char buffer[64];
	buffer[0] = '\0';
	(void) strftime(buffer, sizeof(buffer), tpl, &split);
	return std::string(buffer);
}

}

namespace Util {

std::string date(double epoch) {
	auto seconds = time_t(floor(epoch));
	auto ret = strftime_utc(seconds, "UTC %Y-%m-%d %H:%M:%S");

	/* Milliseconds.  */
	auto subsecond = epoch - double(seconds);
	auto milliseconds = std::uint32_t(floor(subsecond * 1000));
	/* In case of roundoff error... maybe.  */
	if (milliseconds > 999)
		milliseconds = 999;
	char msbuf[8];
	(void) snprintf(msbuf, sizeof(msbuf), ".%03" PRIu32, milliseconds);

	return ret + msbuf;
}

std::string day(double epoch) {
	return strftime_utc(time_t(floor(epoch)), "%Y-%m-%d");
}

}
