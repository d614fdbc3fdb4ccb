#ifndef TESTS_VAULT_MOCKENV_HPP
#define TESTS_VAULT_MOCKENV_HPP

#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"
#include"Ledger/Hash.hpp"
#include"Ledger/ReaderIF.hpp"
#include"Ledger/Receipt.hpp"
#include"Ledger/SubmitterIF.hpp"
#include"Ledger/TxRequest.hpp"
#include"Ledger/errors.hpp"
#include"Vault/CashOutResult.hpp"
#include"Vault/CashoutService.hpp"
#include"Vault/ChequeStoreIF.hpp"
#include"Vault/SignedCheque.hpp"
#include"Vault/errors.hpp"
#include<cstdint>
#include<map>
#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

/* A scripted ledger and cheque source.
 * Transactions are pending until given a receipt.  */
class MockEnv : public Ledger::ReaderIF
	      , public Ledger::SubmitterIF
	      , public Vault::ChequeStoreIF
	      {
public:
	std::map<Ledger::Address, Vault::SignedCheque> cheques;
	/* Transactions the node knows.  Absent ones
	 * give Ledger::NotFound.  */
	std::map<Ledger::Hash, Ledger::TxInfo> txs;
	std::map<Ledger::Hash, Ledger::Receipt> receipts;
	/* What paidOut returns, as JSON.  */
	std::string paid_out = "[\"0\"]";
	/* Makes every pending wait_for_receipt fail.  */
	bool wait_error = false;

	std::vector<Ledger::TxRequest> sent;
	std::vector<Ledger::TxRequest> calls;

	Ev::Io<Ledger::TxInfo>
	transaction_by_hash(Ledger::Hash h) override {
		return Ev::yield().then([this, h]() {
			auto it = txs.find(h);
			if (it == txs.end())
				throw Ledger::NotFound(std::string(h));
			return Ev::lift(it->second);
		});
	}
	Ev::Io<Ledger::Receipt>
	transaction_receipt(Ledger::Hash h) override {
		return Ev::yield().then([this, h]() {
			auto it = receipts.find(h);
			if (it == receipts.end())
				throw std::runtime_error("no receipt");
			return Ev::lift(it->second);
		});
	}

	Ev::Io<Jsmn::Object> call(Ledger::TxRequest req) override {
		calls.push_back(req);
		return Ev::yield().then([this]() {
			return Ev::lift(Jsmn::Object::parse_json(paid_out));
		});
	}
	Ev::Io<Ledger::Hash> send(Ledger::TxRequest req) override {
		sent.push_back(req);
		auto os = std::ostringstream();
		os << std::hex << sent.size();
		auto digits = os.str();
		auto h = Ledger::Hash(std::string(64 - digits.size(), '0') + digits);
		auto info = Ledger::TxInfo();
		info.pending = true;
		txs[h] = info;
		return Ev::yield().then([h]() {
			return Ev::lift(h);
		});
	}
	Ev::Io<Ledger::Receipt> wait_for_receipt(Ledger::Hash h) override {
		return Ev::yield().then([this, h]() {
			if (wait_error)
				throw std::runtime_error("connection lost");
			auto it = receipts.find(h);
			if (it == receipts.end())
				return wait_for_receipt(h);
			return Ev::lift(it->second);
		});
	}

	Ev::Io<Vault::SignedCheque>
	last_received_cheque(Ledger::Address const& vault) override {
		return Ev::yield().then([this, vault]() {
			auto it = cheques.find(vault);
			if (it == cheques.end())
				throw Vault::NoPriorCheque(std::string(vault));
			return Ev::lift(it->second);
		});
	}

	/* Helpers to script the ledger.  */
	void give_cheque( Ledger::Address const& vault
			, Ledger::Address const& beneficiary
			, std::uint64_t cumulative
			) {
		auto c = Vault::SignedCheque();
		c.vault = vault;
		c.beneficiary = beneficiary;
		c.cumulative_payout = Ledger::Amount::units(cumulative);
		c.signature = std::vector<std::uint8_t>{0x01, 0x02, 0x03};
		cheques[vault] = c;
	}
	/* Mines the transaction with the given events, an
	 * array of {"address", "event", "args"}.  */
	void mine( Ledger::Hash const& h
		 , bool success
		 , std::string const& logs
		 ) {
		auto r = Ledger::Receipt::object(Jsmn::Object::parse_json(
			std::string("{\"transactionHash\": \"") + std::string(h)
			+ "\", \"status\": " + (success ? "true" : "false")
			+ ", \"logs\": " + logs + "}"
		));
		receipts[h] = r;
		auto info = Ledger::TxInfo();
		info.pending = false;
		txs[h] = info;
	}
	/* A ChequeCashed log entry.  */
	static
	std::string cashed( Ledger::Address const& vault
			  , Ledger::Address const& beneficiary
			  , std::uint64_t total
			  , std::uint64_t cumulative
			  ) {
		auto os = std::ostringstream();
		os << "{\"address\": \"" << vault << "\""
		   << ", \"event\": \"ChequeCashed\""
		   << ", \"args\": {"
		   << "\"beneficiary\": \"" << beneficiary << "\""
		   << ", \"recipient\": \"" << beneficiary << "\""
		   << ", \"caller\": \"" << beneficiary << "\""
		   << ", \"totalPayout\": \"" << total << "\""
		   << ", \"cumulativePayout\": \"" << cumulative << "\""
		   << ", \"callerPayout\": \"0\""
		   << "}}"
		    ;
		return os.str();
	}
	static
	std::string bounced(Ledger::Address const& vault) {
		auto os = std::ostringstream();
		os << "{\"address\": \"" << vault << "\""
		   << ", \"event\": \"ChequeBounced\""
		   << ", \"args\": {}}"
		    ;
		return os.str();
	}
};

/* Waits for the background finalizer of the
 * transaction to record its result.  */
inline
Ev::Io<Vault::CashOutResult>
result_of( Vault::CashoutService& service
	 , Ledger::Address const& vault
	 , Ledger::Hash const& tx
	 ) {
	auto pservice = &service;
	return Ev::yield().then([pservice]() {
		return pservice->cashout_results();
	}).then([pservice, vault, tx](std::vector<Vault::CashOutResult> rs) {
		for (auto const& r : rs)
			if (r.vault == vault && r.tx_hash == tx)
				return Ev::lift(r);
		return result_of(*pservice, vault, tx);
	});
}

#endif /* !defined(TESTS_VAULT_MOCKENV_HPP) */
