#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<stdarg.h>
#include<string>
#include<vector>

namespace {

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto ret = Util::Str::vfmt(tpl, ap);
	va_end(ap);
	return ret;
}

}

int main() {
	auto bytes = std::vector<std::uint8_t>{0x00, 0x7f, 0xab, 0xff};
	assert(Util::Str::hexdump(bytes.data(), bytes.size()) == "007fabff");
	assert(Util::Str::hexdump(bytes.data() + 1, 1) == "7f");
	assert(Util::Str::hexread("007FabFF") == bytes);
	assert(Util::Str::hexread("").empty());

	assert(Util::Str::ishex("00ff"));
	assert(!Util::Str::ishex("0ff"));
	assert(!Util::Str::ishex("zz"));

	auto thrown = false;
	try {
		(void) Util::Str::hexread("abc");
	} catch (Util::Str::HexParseFailure const&) {
		thrown = true;
	}
	assert(thrown);

	assert(fmt("%s-%d", "x", 42) == "x-42");
	/* Longer than any fixed first-try buffer.  */
	auto lng = std::string(1000, 'a');
	assert(fmt("%s!", lng.c_str()) == lng + "!");

	return 0;
}
