#include"Jsmn/Object.hpp"
#include"Ledger/Detail/fixed_hex.hpp"
#include"Ledger/Hash.hpp"
#include"Util/Str.hpp"
#include<stdexcept>
#include<string.h>

namespace {

std::uint8_t const zeroes[32] = { 0 };

}

namespace Ledger {

Hash::Hash(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument(
			std::string("Ledger::Hash: not a hash: ") + s
		);
	auto tmp = std::make_shared<Impl>();
	Detail::fixed_hex_read(s, tmp->d, sizeof(tmp->d));
	pimpl = std::move(tmp);
}

bool Hash::valid_string(std::string const& s) {
	return Detail::fixed_hex_valid(s, sizeof(Impl::d));
}

Hash Hash::object(Jsmn::Object const& o) {
	if (!o.is_string())
		throw std::invalid_argument("Ledger::Hash json object invalid.");
	return Hash(std::string(o));
}

Hash::operator std::string() const {
	auto d = pimpl ? pimpl->d : zeroes;
	return "0x" + Util::Str::hexdump(d, sizeof(zeroes));
}

bool Hash::operator==(Hash const& o) const {
	if (pimpl == o.pimpl)
		return true;
	auto a = pimpl ? pimpl->d : zeroes;
	auto b = o.pimpl ? o.pimpl->d : zeroes;
	return 0 == memcmp(a, b, sizeof(zeroes));
}
bool Hash::operator<(Hash const& o) const {
	auto a = pimpl ? pimpl->d : zeroes;
	auto b = o.pimpl ? o.pimpl->d : zeroes;
	return memcmp(a, b, sizeof(zeroes)) < 0;
}

std::ostream& operator<<(std::ostream& os, Hash const& h) {
	return os << std::string(h);
}

}
