#include"Jsmn/Object.hpp"
#include"Ledger/Address.hpp"
#include"Ledger/Detail/fixed_hex.hpp"
#include"Util/Str.hpp"
#include<stdexcept>
#include<string.h>

namespace Ledger {

Address::Address() {
	memset(raw, 0, sizeof(raw));
}

Address::Address(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument(
			std::string("Ledger::Address: not an address: ") + s
		);
	Detail::fixed_hex_read(s, raw, sizeof(raw));
}

bool Address::valid_string(std::string const& s) {
	return Detail::fixed_hex_valid(s, sizeof(raw));
}

Address Address::object(Jsmn::Object const& o) {
	if (!o.is_string())
		throw std::invalid_argument("Ledger::Address json object invalid.");
	return Address(std::string(o));
}

Address::operator std::string() const {
	return "0x" + hex();
}
std::string Address::hex() const {
	return Util::Str::hexdump(raw, sizeof(raw));
}

bool Address::operator==(Address const& o) const {
	return 0 == memcmp(raw, o.raw, sizeof(raw));
}
bool Address::operator<(Address const& o) const {
	return memcmp(raw, o.raw, sizeof(raw)) < 0;
}

std::ostream& operator<<(std::ostream& os, Address const& a) {
	return os << std::string(a);
}

}
