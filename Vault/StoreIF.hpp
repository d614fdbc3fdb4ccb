#ifndef VAULT_STOREIF_HPP
#define VAULT_STOREIF_HPP

#include<functional>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Vault {

/** class Vault::StoreIF
 *
 * @brief abstract key-value store for the records
 * of the cash-out service.
 *
 * @desc Each get and put is atomic on its own; there
 * are no multi-key transactions.
 */
class StoreIF {
public:
	/* Return true to stop iterating.  */
	typedef std::function< Ev::Io<bool>( std::string const& key
					   , std::string const& value
					   )> Visitor;

	virtual ~StoreIF() { }

	/** Vault::StoreIF::get
	 *
	 * @return nullptr if the key is absent.
	 */
	virtual
	Ev::Io<std::unique_ptr<std::string>> get(std::string const& key) =0;

	/** Vault::StoreIF::put
	 *
	 * @brief creates or overwrites the key.
	 */
	virtual
	Ev::Io<void> put(std::string const& key, std::string const& value) =0;

	/** Vault::StoreIF::iterate
	 *
	 * @brief visits every key with the given prefix,
	 * in key order, until the visitor returns true.
	 *
	 * @desc Keys are fetched lazily, one at a time,
	 * so the visitor may itself get and put.
	 */
	virtual
	Ev::Io<void> iterate(std::string const& prefix, Visitor visitor) =0;
};

}

#endif /* !defined(VAULT_STOREIF_HPP) */
