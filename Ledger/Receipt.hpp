#ifndef LEDGER_RECEIPT_HPP
#define LEDGER_RECEIPT_HPP

#include"Ledger/Event.hpp"
#include"Ledger/Hash.hpp"
#include<vector>

namespace Jsmn { class Object; }

namespace Ledger {

/** struct Ledger::Receipt
 *
 * @brief the ledger's record of a mined transaction.
 */
struct Receipt {
	Ledger::Hash tx_hash;
	/* False if the transaction reverted.  */
	bool success;
	std::vector<Ledger::Event> events;

	Receipt() : success(false) { }

	/** Ledger::Receipt::object
	 *
	 * @brief decodes
	 * `{"transactionHash", "status", "logs": [...]}`
	 * where each log is `{"address", "event", "args"}`.
	 *
	 * @desc status may be 1/0, "0x1"/"0x0" or a boolean.
	 * Throws std::invalid_argument or Jsmn::TypeError on
	 * malformed input.
	 */
	static Receipt object(Jsmn::Object const&);
};

}

#endif /* !defined(LEDGER_RECEIPT_HPP) */
