#include"Jsmn/Object.hpp"
#include"Ledger/Amount.hpp"
#include<algorithm>
#include<stdexcept>

namespace {

bool all_digits(std::string::const_iterator b, std::string::const_iterator e) {
	return std::all_of(b, e, [](char c) { return '0' <= c && c <= '9'; });
}

bool is_hex_text(std::string const& s) {
	if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X'))
		return false;
	return std::all_of(s.begin() + 2, s.end(), [](char c) {
		return ('0' <= c && c <= '9')
		    || ('a' <= c && c <= 'f')
		    || ('A' <= c && c <= 'F')
		     ;
	});
}

}

namespace Ledger {

bool Amount::valid_string(std::string const& s) {
	if (s.empty())
		return false;
	return all_digits(s.begin(), s.end());
}

bool Amount::valid_object(Jsmn::Object const& o) {
	if (o.is_number())
		return valid_string(o.direct_text());
	else if (o.is_string()) {
		auto s = std::string(o);
		return valid_string(s) || is_hex_text(s);
	} else
		return false;
}

Amount
Amount::object(Jsmn::Object const& o) {
	if (!valid_object(o))
		throw std::invalid_argument("Ledger::Amount json object invalid.");
	/* Numbers are read from their digits, as a double
	 * would lose precision.  */
	if (o.is_number())
		return Amount(o.direct_text());
	auto s = std::string(o);
	if (valid_string(s))
		return Amount(s);
	/* cpp_int reads the 0x prefix itself.  */
	auto ret = Amount();
	ret.v = boost::multiprecision::cpp_int(s);
	return ret;
}

Amount::Amount(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument(
			std::string("Ledger::Amount string invalid: ") + s
		);
	/* cpp_int would take a leading 0 to mean octal.  */
	auto nz = s.find_first_not_of('0');
	if (nz == std::string::npos)
		v = 0;
	else
		v = boost::multiprecision::cpp_int(s.substr(nz));
}
Amount::operator std::string() const {
	return v.str();
}

}
