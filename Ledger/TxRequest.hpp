#ifndef LEDGER_TXREQUEST_HPP
#define LEDGER_TXREQUEST_HPP

#include"Json/Out.hpp"
#include"Ledger/Address.hpp"
#include"Ledger/Amount.hpp"
#include<string>

namespace Ledger {

/** struct Ledger::TxRequest
 *
 * @brief a contract call, either read-only or to be
 * sent as a transaction.
 *
 * @desc The method is named and its parameters are a
 * JSON array; encoding them for the wire is up to the
 * Ledger::SubmitterIF.
 */
struct TxRequest {
	Ledger::Address to;
	std::string method;
	Json::Out params;
	/* Value transferred along with the call.  */
	Ledger::Amount value;
	std::string description;
};

}

#endif /* !defined(LEDGER_TXREQUEST_HPP) */
