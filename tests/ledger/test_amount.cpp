#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Ledger/Amount.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

int main() {
	using Ledger::Amount;

	/* Beyond 64 bits.  */
	auto big = Amount("340282366920938463463374607431768211456");
	assert(std::string(big) == "340282366920938463463374607431768211456");
	assert(std::string(big + Amount::units(1))
	       == "340282366920938463463374607431768211457");

	/* Leading zeros are decimal, not octal.  */
	assert(Amount("010") == Amount::units(10));
	assert(std::string(Amount("000")) == "0");
	assert(Amount() == Amount::units(0));

	/* Subtraction saturates at zero.  */
	assert(Amount::units(150) - Amount::units(100) == Amount::units(50));
	assert(Amount::units(100) - Amount::units(150) == Amount());
	assert(Amount::units(100) - Amount::units(100) == Amount());

	assert(Amount::units(1) < Amount::units(2));
	assert(Amount::units(2) >= Amount::units(2));
	assert(Amount::units(3) != Amount::units(2));

	assert(!Amount::valid_string(""));
	assert(!Amount::valid_string("-1"));
	assert(!Amount::valid_string("1.5"));
	assert(!Amount::valid_string("0x10"));
	auto thrown = false;
	try {
		(void) Amount("12a");
	} catch (std::invalid_argument const&) {
		thrown = true;
	}
	assert(thrown);

	/* JSON forms.  */
	auto js = Jsmn::Object::parse_json(R"JSON(
	[ 123456789012345678901234567890
	, "42"
	, "0x2a"
	, 1.5
	, "x"
	, null
	]
	)JSON");
	assert(Amount::object(js[std::size_t(0)])
	       == Amount("123456789012345678901234567890"));
	assert(Amount::object(js[1]) == Amount::units(42));
	assert(Amount::object(js[2]) == Amount::units(42));
	assert(!Amount::valid_object(js[3]));
	assert(!Amount::valid_object(js[4]));
	assert(!Amount::valid_object(js[5]));

	auto os = std::ostringstream();
	os << Amount::units(18446744073709551615ULL) + Amount::units(1);
	assert(os.str() == "18446744073709551616");

	return 0;
}
