#ifndef VAULT_DETAIL_FINALIZER_HPP
#define VAULT_DETAIL_FINALIZER_HPP

#include"Ledger/Address.hpp"
#include"Ledger/Hash.hpp"
#include"Vault/CashOutResult.hpp"
#include"Vault/SignedCheque.hpp"
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ledger { class SubmitterIF; }
namespace S { class Bus; }
namespace Vault { class CashoutService; }
namespace Vault { class StoreIF; }
namespace Vault { struct CashChequeResult; }

namespace Vault { namespace Detail {

/** class Vault::Detail::Finalizer
 *
 * @brief follows one submitted cash-out until it is
 * mined, then records its outcome.
 *
 * @desc On confirmation the aggregate counters are
 * updated.
 * Whatever happens, the vault's cash-out result is
 * overwritten with "success" or "fail".
 * Failures along the way are logged and never
 * propagated.
 */
class Finalizer : public std::enable_shared_from_this<Finalizer> {
private:
	S::Bus& bus;
	Vault::StoreIF& store;
	Ledger::SubmitterIF& submitter;
	Vault::CashoutService& service;
	Ledger::Address vault;
	Ledger::Hash tx_hash;
	Vault::SignedCheque cheque;

	/* What we will store.  */
	Vault::CashOutResult result;

	Finalizer( S::Bus& bus_
		 , Vault::StoreIF& store_
		 , Ledger::SubmitterIF& submitter_
		 , Vault::CashoutService& service_
		 , Ledger::Address const& vault_
		 , Ledger::Hash const& tx_hash_
		 , Vault::SignedCheque cheque_
		 ) : bus(bus_)
		   , store(store_)
		   , submitter(submitter_)
		   , service(service_)
		   , vault(vault_)
		   , tx_hash(tx_hash_)
		   , cheque(std::move(cheque_))
		   { }

public:
	static
	std::shared_ptr<Finalizer>
	create( S::Bus& bus
	      , Vault::StoreIF& store
	      , Ledger::SubmitterIF& submitter
	      , Vault::CashoutService& service
	      , Ledger::Address const& vault
	      , Ledger::Hash const& tx_hash
	      , Vault::SignedCheque cheque
	      ) {
		return std::shared_ptr<Finalizer>(
			new Finalizer( bus
				     , store
				     , submitter
				     , service
				     , vault
				     , tx_hash
				     , std::move(cheque)
				     )
		);
	}

	Ev::Io<void> run();

private:
	Ev::Io<void> core_run();

	Ev::Io<void> on_wait_failure();
	Ev::Io<void> on_mined();
	Ev::Io<void> on_confirmed(Vault::CashChequeResult const&);
	Ev::Io<void> move_uncashed_count();
	Ev::Io<void> save();

	/* Logs a failure of the action and carries on.  */
	Ev::Io<void> guarded(std::string what, Ev::Io<void> action);

	/* Wrappers.  */
	Ev::Io<void> logd(std::string);
	Ev::Io<void> logi(std::string);
	Ev::Io<void> logw(std::string);
	std::string logprefix(std::string);
};

}}

#endif /* !defined(VAULT_DETAIL_FINALIZER_HPP) */
