#ifndef VAULT_ERRORS_HPP
#define VAULT_ERRORS_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Vault {

/* No cheque was ever received for the vault.
 * Not the same as a cheque that was never cashed.  */
struct NoPriorCheque : public Util::BacktraceException<std::runtime_error> {
	NoPriorCheque(std::string const& vault)
		: Util::BacktraceException<std::runtime_error>(
			"Vault: no prior cheque for " + vault
		  ) { }
};

/* A contract call returned something other than
 * what the method declares.  */
struct AbiDecodeError : public Util::BacktraceException<std::runtime_error> {
	AbiDecodeError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Vault: could not decode: " + msg
		  ) { }
};

/* A stored record is not in the format we write.  */
struct RecordDecodeError : public Util::BacktraceException<std::runtime_error> {
	RecordDecodeError(std::string const& key, std::string const& why)
		: Util::BacktraceException<std::runtime_error>(
			"Vault: bad record at " + key + ": " + why
		  ) { }
};

}

#endif /* !defined(VAULT_ERRORS_HPP) */
