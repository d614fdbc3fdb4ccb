#ifndef LEDGER_FIND_SINGLE_EVENT_HPP
#define LEDGER_FIND_SINGLE_EVENT_HPP

#include<string>

namespace Ledger { class Address; }
namespace Ledger { struct Event; }
namespace Ledger { struct Receipt; }

namespace Ledger {

/** Ledger::find_single_event
 *
 * @brief finds the one event of the given name emitted
 * by the given contract in the receipt.
 *
 * @desc Throws Ledger::EventNotFound if there is none,
 * Ledger::EventDecodeAmbiguous if there is more than
 * one.
 * Events from other contracts are ignored.
 */
Ledger::Event const&
find_single_event( Ledger::Receipt const& receipt
		 , Ledger::Address const& address
		 , std::string const& name
		 );

}

#endif /* !defined(LEDGER_FIND_SINGLE_EVENT_HPP) */
