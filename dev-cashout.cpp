#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"
#include"Ledger/Hash.hpp"
#include"Ledger/ReaderIF.hpp"
#include"Ledger/Receipt.hpp"
#include"Ledger/SubmitterIF.hpp"
#include"Ledger/TxRequest.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Util/BacktraceException.hpp"
#include"Vault/CashOutResult.hpp"
#include"Vault/CashoutAction.hpp"
#include"Vault/CashoutService.hpp"
#include"Vault/CashoutStats.hpp"
#include"Vault/ChequeStoreIF.hpp"
#include"Vault/DbStore.hpp"
#include"Vault/Detail/decode_record.hpp"
#include"Vault/Mod/JsonOutputter.hpp"
#include"Vault/SignedCheque.hpp"
#include"Vault/keys.hpp"
#include<algorithm>
#include<iostream>
#include<iterator>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

struct Offline : public Util::BacktraceException<std::runtime_error> {
	Offline() : Util::BacktraceException<std::runtime_error>("offline") { }
};

/* Stands in for the ledger and the cheque source,
 * which this tool never connects to.  */
class Env : public Ledger::ReaderIF
	  , public Ledger::SubmitterIF
	  , public Vault::ChequeStoreIF
	  {
public:
	Ev::Io<Ledger::TxInfo>
	transaction_by_hash(Ledger::Hash) override {
		return Ev::lift().then([]() {
			throw Offline();
			return Ev::lift(Ledger::TxInfo());
		});
	}
	Ev::Io<Ledger::Receipt>
	transaction_receipt(Ledger::Hash) override {
		return Ev::lift().then([]() {
			throw Offline();
			return Ev::lift(Ledger::Receipt());
		});
	}
	Ev::Io<Jsmn::Object> call(Ledger::TxRequest) override {
		return Ev::lift().then([]() {
			throw Offline();
			return Ev::lift(Jsmn::Object());
		});
	}
	Ev::Io<Ledger::Hash> send(Ledger::TxRequest) override {
		return Ev::lift().then([]() {
			throw Offline();
			return Ev::lift(Ledger::Hash());
		});
	}
	Ev::Io<Ledger::Receipt> wait_for_receipt(Ledger::Hash) override {
		return Ev::lift().then([]() {
			throw Offline();
			return Ev::lift(Ledger::Receipt());
		});
	}
	Ev::Io<Vault::SignedCheque>
	last_received_cheque(Ledger::Address const&) override {
		return Ev::lift().then([]() {
			throw Offline();
			return Ev::lift(Vault::SignedCheque());
		});
	}
};

void usage() {
	std::cout << "Usage: dev-cashout [--db=<file>] <command>" << std::endl
		  << "  results" << std::endl
		  << "  stats" << std::endl
		  << "  action $vault" << std::endl
		  << "  count-uncashed $vault" << std::endl
		   ;
}

}

int main(int argc, char** c_argv) {
	auto argv = std::vector<std::string>();
	std::copy( c_argv, c_argv + argc
		 , std::back_inserter(argv)
		 );

	auto dbfile = std::string("data.dev-cashout");
	auto db_opt = std::string("--db=");
	if (argv.size() >= 2 && argv[1].substr(0, db_opt.size()) == db_opt) {
		dbfile = argv[1].substr(db_opt.size());
		argv.erase(argv.begin() + 1);
	}
	if (argv.size() < 2) {
		usage();
		return 0;
	}
	auto const& command = argv[1];
	auto vault = Ledger::Address();
	if (command == "action" || command == "count-uncashed") {
		if (argv.size() < 3 || !Ledger::Address::valid_string(argv[2])) {
			std::cerr << "need a vault address" << std::endl;
			return 1;
		}
		vault = Ledger::Address(argv[2]);
	}

	auto bus = S::Bus();
	auto outputter = Vault::Mod::JsonOutputter(std::cerr, bus);
	auto store = Vault::DbStore(Sqlite3::Db(dbfile));
	auto env = Env();
	auto service = Vault::CashoutService(bus, store, env, env, env);

	auto print = [](Json::Out const& js) {
		std::cout << js.output() << std::endl;
		return Ev::lift(0);
	};

	auto code = Ev::lift().then([&]() {
		if (command == "results") {
			return service.cashout_results().then([&](std::vector<Vault::CashOutResult> rs) {
				auto js = Json::Out();
				auto arr = js.start_array();
				for (auto const& r : rs)
					arr.entry(r.json());
				arr.end_array();
				return print(js);
			});
		} else if (command == "stats") {
			return service.cashout_stats().then([&](Vault::CashoutStats stats) {
				auto js = Json::Out()
					.start_object()
						.field( "total_received_cashed"
						      , std::string(stats.total_received_cashed)
						      )
						.field( "today_received_cashed"
						      , std::string(stats.today_received_cashed)
						      )
						.field( "total_received_cashed_count"
						      , stats.total_received_cashed_count
						      )
					.end_object()
					;
				return print(js);
			});
		} else if (command == "action") {
			auto key = Vault::Key::cashout_action(vault);
			return store.get(key).then([&, key](std::unique_ptr<std::string> raw) {
				if (!raw)
					return print(Json::Out::scalar(nullptr));
				auto action = Vault::Detail::decode_record<Vault::CashoutAction>(
					key, *raw
				);
				return print(action.json());
			});
		} else if (command == "count-uncashed") {
			return service.count_uncashed_record(vault).then([]() {
				return Ev::lift(0);
			});
		}

		usage();
		return Ev::lift(1);
	});
	return Ev::start(code);
}
