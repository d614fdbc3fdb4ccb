#ifndef VAULT_KEYS_HPP
#define VAULT_KEYS_HPP

#include<string>

namespace Ledger { class Address; }

/* Keys of the records kept in the Vault::StoreIF.  */
namespace Vault { namespace Key {

/* Last submitted cash-out of a vault.  */
std::string cashout_action(Ledger::Address const& vault);

/* Last finalized cash-out result of a vault; all of
 * them share the prefix.  */
std::string cashout_result_prefix();
std::string cashout_result(Ledger::Address const& vault);

std::string total_received_cashed();
/* day is "YYYY-MM-DD", UTC.  */
std::string daily_received_cashed(std::string const& day);
std::string total_received_cashed_count();

/* Cheques received from the vault that are not yet
 * counted in total_received_cashed_count.  */
std::string peer_uncashed_count(Ledger::Address const& vault);

}}

#endif /* !defined(VAULT_KEYS_HPP) */
