#ifndef LEDGER_HASH_HPP
#define LEDGER_HASH_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>

namespace Jsmn { class Object; }

namespace Ledger {

/** class Ledger::Hash
 *
 * @brief 32-byte transaction hash.
 *
 * @desc A default-constructed hash is null, i.e.
 * it refers to no transaction; it prints as all
 * zeroes.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[32];
	};
	std::shared_ptr<Impl const> pimpl;

public:
	Hash() =default;
	Hash(Hash const&) =default;
	Hash(Hash&&) =default;
	Hash& operator=(Hash const&) =default;
	Hash& operator=(Hash&&) =default;
	~Hash() =default;

	/* Throws std::invalid_argument.  */
	explicit
	Hash(std::string const&);
	static bool valid_string(std::string const&);

	static Hash object(Jsmn::Object const&);

	/* "0x" and 64 lowercase hex digits.  */
	explicit
	operator std::string() const;

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& o) const {
		return !(*this == o);
	}
	bool operator<(Hash const&) const;
};

std::ostream& operator<<(std::ostream&, Hash const&);

}

#endif /* !defined(LEDGER_HASH_HPP) */
