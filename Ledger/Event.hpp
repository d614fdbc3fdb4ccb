#ifndef LEDGER_EVENT_HPP
#define LEDGER_EVENT_HPP

#include"Jsmn/Object.hpp"
#include"Ledger/Address.hpp"
#include<string>

namespace Ledger {

/** struct Ledger::Event
 *
 * @brief one event emitted by a contract during
 * a transaction, with its arguments already
 * decoded by name.
 */
struct Event {
	/* Contract that emitted it.  */
	Ledger::Address address;
	std::string name;
	/* A JSON object of argument name to value.  */
	Jsmn::Object args;
};

}

#endif /* !defined(LEDGER_EVENT_HPP) */
