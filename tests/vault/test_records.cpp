#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ledger/TxRequest.hpp"
#include"Vault/Abi.hpp"
#include"Vault/CashChequeResult.hpp"
#include"Vault/CashOutResult.hpp"
#include"Vault/CashoutAction.hpp"
#include"Vault/Detail/decode_record.hpp"
#include"Vault/SignedCheque.hpp"
#include"Vault/errors.hpp"
#include<assert.h>
#include<initializer_list>

namespace {

auto const vault = Ledger::Address("0x1000000000000000000000000000000000000001");
auto const beneficiary = Ledger::Address("0x2000000000000000000000000000000000000002");
auto const tx = Ledger::Hash("0x00000000000000000000000000000000000000000000000000000000000000aa");

Vault::SignedCheque make_cheque() {
	auto c = Vault::SignedCheque();
	c.vault = vault;
	c.beneficiary = beneficiary;
	c.cumulative_payout = Ledger::Amount("100000000000000000000000");
	c.signature = std::vector<std::uint8_t>{0xde, 0xad, 0xbe, 0xef};
	return c;
}

}

int main() {
	/* Stored cash-out action.  */
	{
		auto action = Vault::CashoutAction();
		action.tx_hash = tx;
		action.cheque = make_cheque();

		auto js = Jsmn::Object::parse_json(action.json().output());
		assert(std::string(js["tx_hash"]) == std::string(tx));
		assert(std::string(js["cheque"]["vault"]) == std::string(vault));
		assert(std::string(js["cheque"]["cumulative_payout"])
		       == "100000000000000000000000");
		assert(std::string(js["cheque"]["signature"]) == "deadbeef");

		auto back = Vault::CashoutAction::object(js);
		assert(back.tx_hash == tx);
		assert(back.cheque == make_cheque());
	}

	/* Stored result.  */
	{
		auto r = Vault::CashOutResult();
		r.tx_hash = tx;
		r.vault = vault;
		r.amount = Ledger::Amount::units(50);
		r.cash_time = 1700000000;
		r.success = true;

		auto js = Jsmn::Object::parse_json(r.json().output());
		assert(std::string(js["status"]) == "success");
		assert(std::string(js["amount"]) == "50");
		assert(js["cash_time"].direct_text() == "1700000000");
		assert(Vault::CashOutResult::object(js) == r);

		r.success = false;
		js = Jsmn::Object::parse_json(r.json().output());
		assert(std::string(js["status"]) == "fail");
		assert(Vault::CashOutResult::object(js) == r);

		/* Anything we did not write is a decode error.  */
		auto thrown = false;
		try {
			(void) Vault::Detail::decode_record<Vault::CashOutResult>(
				"k", "{\"status\": \"success\"}"
			);
		} catch (Vault::RecordDecodeError const&) {
			thrown = true;
		}
		assert(thrown);
		thrown = false;
		try {
			(void) Vault::Detail::decode_record<Vault::CashOutResult>(
				"k", "not json"
			);
		} catch (Vault::RecordDecodeError const&) {
			thrown = true;
		}
		assert(thrown);
	}

	/* Amounts compare by value.  */
	{
		auto a = Vault::CashChequeResult();
		a.total_payout = Ledger::Amount("10");
		auto b = a;
		b.total_payout = Ledger::Amount("0010");
		assert(a == b);
		b.bounced = true;
		assert(a != b);
	}

	/* Contract calls.  */
	{
		auto req = Vault::Abi::cash_cheque_beneficiary( vault, beneficiary
							      , Ledger::Amount::units(100)
							      , make_cheque().signature
							      );
		assert(req.to == vault);
		assert(req.method == "cashChequeBeneficiary");
		assert(req.value == Ledger::Amount());
		auto params = Jsmn::Object::parse_json(req.params.output());
		assert(params.size() == 3);
		assert(std::string(params[std::size_t(0)]) == std::string(beneficiary));
		assert(std::string(params[1]) == "100");
		assert(std::string(params[2]) == "0xdeadbeef");

		req = Vault::Abi::paid_out(vault, beneficiary);
		assert(req.to == vault);
		assert(req.method == "paidOut");

		auto paid = Vault::Abi::decode_paid_out(
			Jsmn::Object::parse_json("[\"0x64\"]")
		);
		assert(paid == Ledger::Amount::units(100));

		for (auto bad : { "[]", "[\"1\", \"2\"]", "[\"x\"]", "{}" }) {
			auto thrown = false;
			try {
				(void) Vault::Abi::decode_paid_out(
					Jsmn::Object::parse_json(bad)
				);
			} catch (Vault::AbiDecodeError const&) {
				thrown = true;
			}
			assert(thrown);
		}
	}

	return 0;
}
