#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ledger/Hash.hpp"
#include"Ledger/ReaderIF.hpp"
#include"Ledger/Receipt.hpp"
#include"Ledger/SubmitterIF.hpp"
#include"Ledger/TxRequest.hpp"
#include"Ledger/errors.hpp"
#include"Util/date.hpp"
#include"Util/make_unique.hpp"
#include"Vault/Abi.hpp"
#include"Vault/CashOutResult.hpp"
#include"Vault/CashoutAction.hpp"
#include"Vault/CashoutService.hpp"
#include"Vault/CashoutStats.hpp"
#include"Vault/CashoutStatus.hpp"
#include"Vault/ChequeStoreIF.hpp"
#include"Vault/Detail/Finalizer.hpp"
#include"Vault/Detail/counters.hpp"
#include"Vault/Detail/decode_record.hpp"
#include"Vault/Detail/parse_cash_cheque_receipt.hpp"
#include"Vault/StoreIF.hpp"
#include"Vault/concurrent.hpp"
#include"Vault/keys.hpp"
#include"Vault/log.hpp"

namespace {

/* A status pointing at the action, with nothing
 * yet known of its outcome.  */
Vault::CashoutStatus status_of(Vault::CashoutAction const& action) {
	auto ret = Vault::CashoutStatus();
	ret.last = Util::make_unique<Vault::LastCashout>();
	ret.last->tx_hash = action.tx_hash;
	ret.last->cheque = action.cheque;
	return ret;
}

}

namespace Vault {

class CashoutService::Impl {
private:
	CashoutService& self;
	S::Bus& bus;
	Vault::StoreIF& store;
	Vault::ChequeStoreIF& cheques;
	Ledger::ReaderIF& reader;
	Ledger::SubmitterIF& submitter;

	typedef std::shared_ptr<Vault::SignedCheque> ChequeP;
	typedef std::shared_ptr<Vault::CashoutAction> ActionP;

	Ev::Io<Vault::CashoutStatus>
	derive( Ledger::Address const& vault
	      , ChequeP cheque
	      , ActionP action
	      ) {
		return reader.transaction_by_hash(action->tx_hash)
			.catching<Ledger::NotFound>([](Ledger::NotFound const&) {
			/* Not yet propagated to the node we ask.  */
			auto info = Ledger::TxInfo();
			info.pending = true;
			return Ev::lift(info);
		}).then([this, vault, cheque, action](Ledger::TxInfo info) {
			if (info.pending) {
				auto status = status_of(*action);
				status.uncashed_amount = cheque->cumulative_payout
						       - action->cheque.cumulative_payout
						       ;
				return Ev::lift(std::move(status));
			}
			return reader.transaction_receipt(action->tx_hash)
				.then([this, vault, cheque, action](Ledger::Receipt receipt) {
				if (!receipt.success)
					return reverted(vault, cheque, action);
				auto cashed = Detail::parse_cash_cheque_receipt(vault, receipt);
				auto status = status_of(*action);
				status.uncashed_amount = cheque->cumulative_payout
						       - cashed.cumulative_payout
						       ;
				status.last->result = Util::make_unique<CashChequeResult>(
					std::move(cashed)
				);
				return Ev::lift(std::move(status));
			});
		});
	}
	Ev::Io<Vault::CashoutStatus>
	reverted( Ledger::Address const& vault
		, ChequeP cheque
		, ActionP action
		) {
		/* The vault is authoritative on what it has
		 * already paid out.  */
		auto req = Abi::paid_out(vault, cheque->beneficiary);
		return submitter.call(std::move(req)).then([cheque, action](Jsmn::Object outputs) {
			auto paid = Abi::decode_paid_out(outputs);
			auto status = status_of(*action);
			status.last->reverted = true;
			status.uncashed_amount = cheque->cumulative_payout - paid;
			return Ev::lift(std::move(status));
		});
	}

public:
	Impl( CashoutService& self_
	    , S::Bus& bus_
	    , Vault::StoreIF& store_
	    , Vault::ChequeStoreIF& cheques_
	    , Ledger::ReaderIF& reader_
	    , Ledger::SubmitterIF& submitter_
	    ) : self(self_)
	      , bus(bus_)
	      , store(store_)
	      , cheques(cheques_)
	      , reader(reader_)
	      , submitter(submitter_)
	      { }

	Ev::Io<Ledger::Hash>
	cash_cheque( Ledger::Address const& vault
		   , Ledger::Address const& recipient
		   ) {
		return cheques.last_received_cheque(vault)
			.then([this, vault, recipient](SignedCheque c) {
			auto cheque = std::make_shared<SignedCheque>(std::move(c));
			auto req = Abi::cash_cheque_beneficiary( vault
							       , recipient
							       , cheque->cumulative_payout
							       , cheque->signature
							       );
			return submitter.send(std::move(req))
				.then([this, vault, cheque](Ledger::Hash tx_hash) {
				auto action = CashoutAction{tx_hash, *cheque};
				return store.put( Key::cashout_action(vault)
						, action.json().output()
						).then([this, vault, cheque, tx_hash]() {
					auto finalizer = Detail::Finalizer::create(
						bus, store, submitter, self,
						vault, tx_hash, *cheque
					);
					return Vault::concurrent(bus, finalizer->run());
				}).then([this, vault, cheque, tx_hash]() {
					return Vault::log( bus, Info
							 , "CashoutService: %s tx %s: "
							   "cashing out cheque of %s"
							 , std::string(vault).c_str()
							 , std::string(tx_hash).c_str()
							 , std::string(cheque->cumulative_payout).c_str()
							 );
				}).then([tx_hash]() {
					return Ev::lift(tx_hash);
				});
			});
		});
	}

	Ev::Io<Vault::CashoutStatus>
	cashout_status(Ledger::Address const& vault) {
		return cheques.last_received_cheque(vault)
			.then([this, vault](SignedCheque c) {
			auto cheque = std::make_shared<SignedCheque>(std::move(c));
			auto key = Key::cashout_action(vault);
			return store.get(key).then([this, vault, cheque, key](std::unique_ptr<std::string> raw) {
				if (!raw) {
					auto status = CashoutStatus();
					status.uncashed_amount = cheque->cumulative_payout;
					return Ev::lift(std::move(status));
				}
				auto action = std::make_shared<CashoutAction>(
					Detail::decode_record<CashoutAction>(key, *raw)
				);
				return derive(vault, cheque, action);
			});
		});
	}

	Ev::Io<bool>
	has_cashout_action(Ledger::Address const& vault) {
		return store.get(Key::cashout_action(vault))
			.then([](std::unique_ptr<std::string> raw) {
			return Ev::lift(bool(raw));
		});
	}

	Ev::Io<std::vector<Vault::CashOutResult>>
	cashout_results() {
		auto results = std::make_shared<std::vector<CashOutResult>>();
		return store.iterate( Key::cashout_result_prefix()
				    , [results]( std::string const& key
					       , std::string const& value
					       ) {
			results->push_back(
				Detail::decode_record<CashOutResult>(key, value)
			);
			return Ev::lift(false);
		}).then([results]() {
			return Ev::lift(std::move(*results));
		});
	}

	Ev::Io<void>
	count_uncashed_record(Ledger::Address const& vault) {
		auto key = Key::peer_uncashed_count(vault);
		return Detail::get_count(store, key).then([this, key](std::uint64_t n) {
			return Detail::put_count(store, key, n + 1);
		});
	}

	Ev::Io<Vault::CashoutStats>
	cashout_stats() {
		auto stats = std::make_shared<CashoutStats>();
		auto today = Util::day(Ev::now());
		return Detail::get_amount( store, Key::total_received_cashed()
					 ).then([this, stats, today](Ledger::Amount a) {
			stats->total_received_cashed = std::move(a);
			return Detail::get_amount( store
						 , Key::daily_received_cashed(today)
						 );
		}).then([this, stats](Ledger::Amount a) {
			stats->today_received_cashed = std::move(a);
			return Detail::get_count( store
						, Key::total_received_cashed_count()
						);
		}).then([stats](std::uint64_t n) {
			stats->total_received_cashed_count = n;
			return Ev::lift(std::move(*stats));
		});
	}
};

CashoutService::CashoutService( S::Bus& bus
			      , Vault::StoreIF& store
			      , Vault::ChequeStoreIF& cheques
			      , Ledger::ReaderIF& reader
			      , Ledger::SubmitterIF& submitter
			      ) : pimpl(Util::make_unique<Impl>( *this
							       , bus
							       , store
							       , cheques
							       , reader
							       , submitter
							       ))
				{ }
CashoutService::~CashoutService() { }

Ev::Io<Ledger::Hash>
CashoutService::cash_cheque( Ledger::Address const& vault
			   , Ledger::Address const& recipient
			   ) {
	return pimpl->cash_cheque(vault, recipient);
}
Ev::Io<Vault::CashoutStatus>
CashoutService::cashout_status(Ledger::Address const& vault) {
	return pimpl->cashout_status(vault);
}
Ev::Io<bool>
CashoutService::has_cashout_action(Ledger::Address const& vault) {
	return pimpl->has_cashout_action(vault);
}
Ev::Io<std::vector<Vault::CashOutResult>>
CashoutService::cashout_results() {
	return pimpl->cashout_results();
}
Ev::Io<void>
CashoutService::count_uncashed_record(Ledger::Address const& vault) {
	return pimpl->count_uncashed_record(vault);
}
Ev::Io<Vault::CashoutStats>
CashoutService::cashout_stats() {
	return pimpl->cashout_stats();
}

}
