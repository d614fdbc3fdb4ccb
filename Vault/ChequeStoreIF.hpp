#ifndef VAULT_CHEQUESTOREIF_HPP
#define VAULT_CHEQUESTOREIF_HPP

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Address; }
namespace Vault { struct SignedCheque; }

namespace Vault {

/** class Vault::ChequeStoreIF
 *
 * @brief abstract source of the cheques received
 * from vaults.
 */
class ChequeStoreIF {
public:
	virtual ~ChequeStoreIF() { }

	/** Vault::ChequeStoreIF::last_received_cheque
	 *
	 * @brief the most recent cheque received for
	 * the vault.
	 *
	 * @desc Fails with Vault::NoPriorCheque if none
	 * was ever received.
	 */
	virtual
	Ev::Io<Vault::SignedCheque>
	last_received_cheque(Ledger::Address const& vault) =0;
};

}

#endif /* !defined(VAULT_CHEQUESTOREIF_HPP) */
