#ifndef LEDGER_READERIF_HPP
#define LEDGER_READERIF_HPP

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Hash; }
namespace Ledger { struct Receipt; }

namespace Ledger {

/* What the ledger knows about a transaction
 * it has seen.  */
struct TxInfo {
	/* Not yet mined.  */
	bool pending;
};

/** class Ledger::ReaderIF
 *
 * @brief abstract read access to the settlement
 * ledger.
 */
class ReaderIF {
public:
	virtual ~ReaderIF() { }

	/** Ledger::ReaderIF::transaction_by_hash
	 *
	 * @brief looks up a transaction.
	 *
	 * @desc Fails with Ledger::NotFound if the
	 * node does not know the transaction.
	 */
	virtual
	Ev::Io<TxInfo> transaction_by_hash(Ledger::Hash) =0;

	/** Ledger::ReaderIF::transaction_receipt
	 *
	 * @brief fetches the receipt of a mined
	 * transaction.
	 */
	virtual
	Ev::Io<Ledger::Receipt> transaction_receipt(Ledger::Hash) =0;
};

}

#endif /* !defined(LEDGER_READERIF_HPP) */
