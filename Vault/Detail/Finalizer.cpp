#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Json/Out.hpp"
#include"Ledger/Receipt.hpp"
#include"Ledger/SubmitterIF.hpp"
#include"Util/date.hpp"
#include"Vault/CashoutService.hpp"
#include"Vault/CashoutStatus.hpp"
#include"Vault/Detail/Finalizer.hpp"
#include"Vault/Detail/counters.hpp"
#include"Vault/StoreIF.hpp"
#include"Vault/keys.hpp"
#include"Vault/log.hpp"
#include<cstdint>
#include<exception>

namespace Vault { namespace Detail {

std::string Finalizer::logprefix(std::string msg) {
	return std::string("CashoutService: ")
	     + std::string(vault) + " tx " + std::string(tx_hash) + ": "
	     + msg
	     ;
}
Ev::Io<void> Finalizer::logd(std::string msg) {
	return Vault::log(bus, Debug, "%s", logprefix(msg).c_str());
}
Ev::Io<void> Finalizer::logi(std::string msg) {
	return Vault::log(bus, Info, "%s", logprefix(msg).c_str());
}
Ev::Io<void> Finalizer::logw(std::string msg) {
	return Vault::log(bus, Warn, "%s", logprefix(msg).c_str());
}

Ev::Io<void> Finalizer::run() {
	auto self = shared_from_this();
	/* Keep self alive until the run ends.  */
	return Ev::lift().then([self]() {
		return self->core_run();
	}).then([self]() {
		return Ev::lift();
	});
}

Ev::Io<void> Finalizer::core_run() {
	result.tx_hash = tx_hash;
	result.vault = vault;
	result.amount = cheque.cumulative_payout;
	result.success = false;

	return logd("waiting for receipt").then([this]() {
		return submitter.wait_for_receipt(tx_hash);
	}).then([](Ledger::Receipt) {
		return Ev::lift(true);
	}).catching<std::exception>([this](std::exception const& e) {
		return logw(std::string("waiting for receipt: ") + e.what())
			.then([]() {
			return Ev::lift(false);
		});
	}).then([this](bool mined) {
		if (mined)
			return on_mined();
		return on_wait_failure();
	}).then([this]() {
		return save();
	});
}

Ev::Io<void> Finalizer::on_wait_failure() {
	/* Best guess of what is still unredeemed.  */
	return service.cashout_status(vault).then([this](CashoutStatus status) {
		result.amount = status.uncashed_amount;
		return Ev::lift();
	}).catching<std::exception>([this](std::exception const& e) {
		return logw(std::string("estimating uncashed amount: ") + e.what());
	});
}

Ev::Io<void> Finalizer::on_mined() {
	return service.cashout_status(vault).then([this](CashoutStatus status) {
		if (status.last && status.last->result)
			return on_confirmed(*status.last->result);
		result.amount = status.uncashed_amount;
		if (status.last && status.last->reverted)
			return logi("reverted");
		return logi("mined but not yet confirmed");
	}).catching<std::exception>([this](std::exception const& e) {
		return logw(std::string("deriving status: ") + e.what());
	});
}

Ev::Io<void> Finalizer::on_confirmed(CashChequeResult const& cashed) {
	result.amount = cashed.total_payout;
	result.success = true;

	auto total = cashed.total_payout;
	auto today = Util::day(Ev::now());
	return guarded( "total received cashed"
		      , add_amount(store, Key::total_received_cashed(), total)
		      ).then([this, total, today]() {
		return guarded( "daily received cashed"
			      , add_amount( store
					  , Key::daily_received_cashed(today)
					  , total
					  )
			      );
	}).then([this]() {
		return move_uncashed_count();
	});
}

Ev::Io<void> Finalizer::move_uncashed_count() {
	auto peer_key = Key::peer_uncashed_count(vault);
	auto total_key = Key::total_received_cashed_count();
	/* The vault's count is only cleared once it has been
	 * added to the total.  */
	auto move = get_count(store, peer_key).then([this, total_key](std::uint64_t n) {
		return get_count(store, total_key).then([this, total_key, n](std::uint64_t total) {
			return put_count(store, total_key, total + n);
		});
	}).then([this, peer_key]() {
		return put_count(store, peer_key, 0);
	});
	return guarded("uncashed record counts", std::move(move));
}

Ev::Io<void> Finalizer::save() {
	auto now = Ev::now();
	result.cash_time = std::int64_t(now);
	auto status = std::string(result.success ? "success" : "fail");
	return store.put( Key::cashout_result(vault)
			, result.json().output()
			).then([this, status, now]() {
		return logi( "finalized " + status + " at " + Util::date(now)
			   + ", amount " + std::string(result.amount)
			   );
	}).catching<std::exception>([this](std::exception const& e) {
		return logw(std::string("saving result: ") + e.what());
	});
}

Ev::Io<void> Finalizer::guarded(std::string what, Ev::Io<void> action) {
	return action.catching<std::exception>([this, what](std::exception const& e) {
		return logw("updating " + what + ": " + e.what());
	});
}

}}
