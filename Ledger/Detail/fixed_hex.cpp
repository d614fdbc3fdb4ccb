#include"Ledger/Detail/fixed_hex.hpp"
#include"Util/Str.hpp"
#include<algorithm>

namespace {

std::string strip_prefix(std::string const& s) {
	if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
		return s.substr(2);
	return s;
}

}

namespace Ledger { namespace Detail {

bool fixed_hex_valid(std::string const& s, std::size_t size) {
	auto digits = strip_prefix(s);
	return digits.size() == size * 2 && Util::Str::ishex(digits);
}
void fixed_hex_read(std::string const& s, std::uint8_t* out, std::size_t size) {
	auto buf = Util::Str::hexread(strip_prefix(s));
	std::copy(buf.begin(), buf.begin() + size, out);
}

}}
