#include"Ledger/Receipt.hpp"
#include"Ledger/errors.hpp"
#include"Ledger/find_single_event.hpp"

namespace Ledger {

Ledger::Event const&
find_single_event( Ledger::Receipt const& receipt
		 , Ledger::Address const& address
		 , std::string const& name
		 ) {
	auto found = (Ledger::Event const*) nullptr;
	for (auto const& ev : receipt.events) {
		if (ev.name != name || ev.address != address)
			continue;
		if (found)
			throw EventDecodeAmbiguous(name);
		found = &ev;
	}
	if (!found)
		throw EventNotFound(name);
	return *found;
}

}
