#ifndef UTIL_DATE_HPP
#define UTIL_DATE_HPP

#include<string>

namespace Util {

/** Util::date
 *
 * @brief Returns a simple date representation
 * of the given Unix Epoch time.
 */
std::string date(double epoch);

/** Util::day
 *
 * @brief Returns the UTC calendar day containing the
 * given Unix Epoch time, as "YYYY-MM-DD".
 */
std::string day(double epoch);

}

#endif /* !defined(UTIL_DATE_HPP) */
