#ifndef LEDGER_ADDRESS_HPP
#define LEDGER_ADDRESS_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ledger {

/** class Ledger::Address
 *
 * @brief 20-byte address of an account or contract
 * on the settlement ledger.
 *
 * @desc Default-constructs to the all-zeroes address.
 * Text forms are 40 hex digits, optionally prefixed
 * with "0x"; output is always lowercase with "0x".
 */
class Address {
private:
	std::uint8_t raw[20];

public:
	Address();
	Address(Address const&) =default;
	Address& operator=(Address const&) =default;
	~Address() =default;

	/* Throws std::invalid_argument.  */
	explicit
	Address(std::string const&);
	static bool valid_string(std::string const&);

	static Address object(Jsmn::Object const&);

	explicit
	operator std::string() const;
	/* Lowercase hex without the "0x".  */
	std::string hex() const;

	bool operator==(Address const&) const;
	bool operator!=(Address const& o) const {
		return !(*this == o);
	}
	bool operator<(Address const&) const;
	bool operator>(Address const& o) const {
		return o < *this;
	}
};

std::ostream& operator<<(std::ostream&, Address const&);

}

#endif /* !defined(LEDGER_ADDRESS_HPP) */
