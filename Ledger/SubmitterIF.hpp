#ifndef LEDGER_SUBMITTERIF_HPP
#define LEDGER_SUBMITTERIF_HPP

namespace Ev { template<typename a> class Io; }
namespace Jsmn { class Object; }
namespace Ledger { class Hash; }
namespace Ledger { struct Receipt; }
namespace Ledger { struct TxRequest; }

namespace Ledger {

/** class Ledger::SubmitterIF
 *
 * @brief abstract interface for calling contracts
 * and sending transactions.
 */
class SubmitterIF {
public:
	virtual ~SubmitterIF() { }

	/** Ledger::SubmitterIF::call
	 *
	 * @brief performs a read-only call.
	 *
	 * @return the decoded outputs of the method,
	 * as a JSON array.
	 */
	virtual
	Ev::Io<Jsmn::Object> call(Ledger::TxRequest) =0;

	/** Ledger::SubmitterIF::send
	 *
	 * @brief builds, signs and broadcasts a
	 * transaction.
	 *
	 * @return the hash of the sent transaction.
	 */
	virtual
	Ev::Io<Ledger::Hash> send(Ledger::TxRequest) =0;

	/** Ledger::SubmitterIF::wait_for_receipt
	 *
	 * @brief completes once the transaction is mined.
	 *
	 * @desc There is no timeout; this may take
	 * arbitrarily long.
	 */
	virtual
	Ev::Io<Ledger::Receipt> wait_for_receipt(Ledger::Hash) =0;
};

}

#endif /* !defined(LEDGER_SUBMITTERIF_HPP) */
