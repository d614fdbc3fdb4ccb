#ifndef LEDGER_AMOUNT_HPP
#define LEDGER_AMOUNT_HPP

#include<boost/multiprecision/cpp_int.hpp>
#include<cstdint>
#include<iostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ledger {

/** class Ledger::Amount
 *
 * @brief a non-negative amount of the ledger's token,
 * in its smallest unit, of unbounded size.
 *
 * @desc Cumulative payouts routinely exceed 64 bits,
 * so this is backed by an arbitrary-precision
 * integer.
 * Subtraction saturates at zero instead of going
 * negative.
 */
class Amount {
private:
	boost::multiprecision::cpp_int v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount(Amount&&) =default;
	Amount& operator=(Amount const&) =default;
	Amount& operator=(Amount&&) =default;
	~Amount() =default;

	/* Decimal digits only.  Throws std::invalid_argument.  */
	explicit
	Amount(std::string const&);
	/* Decimal digits.  */
	explicit
	operator std::string() const;
	/* Return false if Amount() would throw given this
	 * string.  */
	static
	bool valid_string(std::string const&);

	/* Accepts a decimal string, a "0x" hex string, or an
	 * integral JSON number.  */
	static
	bool valid_object(Jsmn::Object const&);
	static
	Amount object(Jsmn::Object const&);

	static
	Amount units(std::uint64_t u) {
		auto ret = Amount();
		ret.v = u;
		return ret;
	}

	Amount& operator+=(Amount const& i) {
		v += i.v;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	/* Saturates.  */
	Amount& operator-=(Amount const& i) {
		if (i.v > v)
			v = 0;
		else
			v -= i.v;
		return *this;
	}
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator>(Amount const& o) const {
		return o < (*this);
	}
	bool operator<=(Amount const& o) const {
		return !(*this > o);
	}
	bool operator>=(Amount const& o) const {
		return o <= (*this);
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& v) {
	return os << std::string(v);
}

}

#endif /* !defined(LEDGER_AMOUNT_HPP) */
