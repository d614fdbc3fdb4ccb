#ifndef VAULT_CASHOUTSERVICE_HPP
#define VAULT_CASHOUTSERVICE_HPP

#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Address; }
namespace Ledger { class Hash; }
namespace Ledger { class ReaderIF; }
namespace Ledger { class SubmitterIF; }
namespace S { class Bus; }
namespace Vault { class ChequeStoreIF; }
namespace Vault { class StoreIF; }
namespace Vault { struct CashOutResult; }
namespace Vault { struct CashoutStats; }
namespace Vault { struct CashoutStatus; }

namespace Vault {

/** class Vault::CashoutService
 *
 * @brief cashes out received cheques on the ledger and
 * keeps track of how much of them has settled.
 *
 * @desc This is the only writer of the cash-out
 * records and of the aggregate counters in the store.
 *
 * Every cash-out launches a background greenthread
 * that waits for the transaction to be mined and then
 * records the result.
 * These greenthreads refer back to this object and
 * its collaborators, which therefore must outlive
 * them.
 *
 * Logs are raised on the bus.
 */
class CashoutService {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	CashoutService() =delete;
	CashoutService(CashoutService const&) =delete;
	CashoutService(CashoutService&&) =delete;

	CashoutService( S::Bus& bus
		      , Vault::StoreIF& store
		      , Vault::ChequeStoreIF& cheques
		      , Ledger::ReaderIF& reader
		      , Ledger::SubmitterIF& submitter
		      );
	~CashoutService();

	/** Vault::CashoutService::cash_cheque
	 *
	 * @brief submits the latest cheque of the vault for
	 * payment to the recipient.
	 *
	 * @desc Completes as soon as the transaction is
	 * sent and recorded as the vault's cash-out action,
	 * replacing any earlier one.
	 * Fails with Vault::NoPriorCheque if the vault never
	 * sent a cheque.
	 *
	 * @return the transaction hash.
	 */
	Ev::Io<Ledger::Hash>
	cash_cheque( Ledger::Address const& vault
		   , Ledger::Address const& recipient
		   );

	/** Vault::CashoutService::cashout_status
	 *
	 * @brief derives how much of the latest cheque of the
	 * vault is still unredeemed, from the cheque, the
	 * recorded cash-out action and the ledger.
	 *
	 * @desc Fails with Vault::NoPriorCheque, or with an
	 * Ledger::EventDecodeError if a confirmed cash-out
	 * does not have exactly one ChequeCashed event.
	 */
	Ev::Io<Vault::CashoutStatus>
	cashout_status(Ledger::Address const& vault);

	/* Whether a cash-out was ever submitted for the
	 * vault, whatever its outcome.  */
	Ev::Io<bool>
	has_cashout_action(Ledger::Address const& vault);

	/** Vault::CashoutService::cashout_results
	 *
	 * @brief the last finalized cash-out of every
	 * vault, in no particular order.
	 */
	Ev::Io<std::vector<Vault::CashOutResult>>
	cashout_results();

	/* Counts a cheque received from the vault that
	 * has not been cashed yet.  */
	Ev::Io<void>
	count_uncashed_record(Ledger::Address const& vault);

	Ev::Io<Vault::CashoutStats>
	cashout_stats();
};

}

#endif /* !defined(VAULT_CASHOUTSERVICE_HPP) */
