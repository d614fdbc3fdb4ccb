#include"Util/Str.hpp"
#include<iomanip>
#include<sstream>
#include<stdio.h>

namespace Util {
namespace Str {

std::string hexdump(void const* vp, std::size_t s) {
	auto os = std::ostringstream();
	os << std::hex << std::setfill('0');
	auto p = (std::uint8_t const*) vp;
	/* Widen, or iostreams prints a char.  */
	for (auto i = std::size_t(0); i < s; ++i)
		os << std::setw(2) << (unsigned int) p[i];
	return os.str();
}

namespace {

std::uint8_t parse_hex(char c) {
	if (('0' <= c) && (c <= '9')) {
		return (std::uint8_t) (c & 0xF);
	} else if ((('a' <= c) && (c <= 'f')) ||
		   (('A' <= c) && (c <= 'F'))) {
		return (std::uint8_t) ((c + 9) & 0xF);
	} else {
		throw HexParseFailure("Non-hex character: " + std::string(1, c));
	}
}

std::uint8_t parse_hex_byte(char c0, char c1) {
	return (parse_hex(c0) << 4) | (parse_hex(c1));
}

}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buflen = s.length() / 2;
	auto buf = std::vector<std::uint8_t>(buflen);

	for (auto i = std::size_t(0); i < buflen; ++i) {
		buf[i] = parse_hex_byte(s[i * 2], s[i * 2 + 1]);
	}

	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	for (auto const& c : s) {
		if ( ('0' <= c && c <= '9')
		  || ('a' <= c && c <= 'f')
		  || ('A' <= c && c <= 'F')
		   )
			continue;
		return false;
	}
	return true;
}

std::string vfmt(char const *tpl, va_list ap) {
	/* vsnprintf consumes the list, so size it on a copy.  */
	va_list ap2;
	va_copy(ap2, ap);
	auto len = vsnprintf(nullptr, 0, tpl, ap2);
	va_end(ap2);
	if (len < 0)
		throw Util::BacktraceException<std::invalid_argument>(
			std::string("Util::Str::vfmt: bad template: ") + tpl
		);

	auto buf = std::vector<char>(std::size_t(len) + 1);
	(void) vsnprintf(&buf[0], buf.size(), tpl, ap);
	return std::string(&buf[0], std::size_t(len));
}

}
}
