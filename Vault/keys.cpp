#include"Ledger/Address.hpp"
#include"Vault/keys.hpp"

namespace Vault { namespace Key {

std::string cashout_action(Ledger::Address const& vault) {
	return "swap_cashout_" + vault.hex();
}

std::string cashout_result_prefix() {
	return "swap_cashout_result_";
}
std::string cashout_result(Ledger::Address const& vault) {
	return cashout_result_prefix() + vault.hex();
}

std::string total_received_cashed() {
	return "swap_vault_total_received_cashed";
}
std::string daily_received_cashed(std::string const& day) {
	return "swap_vault_total_daily_received_cashed_" + day;
}
std::string total_received_cashed_count() {
	return "swap_vault_total_received_cashed_count";
}

std::string peer_uncashed_count(Ledger::Address const& vault) {
	return "swap_vault_peer_received_uncashed_records_count_"
	     + vault.hex()
	     ;
}

}}
