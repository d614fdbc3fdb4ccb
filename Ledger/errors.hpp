#ifndef LEDGER_ERRORS_HPP
#define LEDGER_ERRORS_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Ledger {

/* The ledger does not know the transaction.  */
struct NotFound : public Util::BacktraceException<std::runtime_error> {
	NotFound(std::string const& what)
		: Util::BacktraceException<std::runtime_error>(
			"Ledger::NotFound: " + what
		  ) { }
};

/* The receipt does not hold the expected events.  */
struct EventDecodeError : public Util::BacktraceException<std::runtime_error> {
	EventDecodeError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};
struct EventNotFound : public EventDecodeError {
	EventNotFound(std::string const& name)
		: EventDecodeError("Ledger: event not found: " + name) { }
};
struct EventDecodeAmbiguous : public EventDecodeError {
	EventDecodeAmbiguous(std::string const& name)
		: EventDecodeError("Ledger: event occurs more than once: " + name) { }
};

}

#endif /* !defined(LEDGER_ERRORS_HPP) */
