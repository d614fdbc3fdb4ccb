#ifndef VAULT_DETAIL_DECODE_RECORD_HPP
#define VAULT_DETAIL_DECODE_RECORD_HPP

#include"Jsmn/Object.hpp"
#include"Vault/errors.hpp"
#include<exception>
#include<string>

namespace Vault { namespace Detail {

/* Decodes a stored JSON record with T::object,
 * reporting any failure as Vault::RecordDecodeError.  */
template<typename T>
T decode_record(std::string const& key, std::string const& value) {
	try {
		return T::object(Jsmn::Object::parse_json(value));
	} catch (Vault::RecordDecodeError const&) {
		throw;
	} catch (std::exception const& e) {
		throw Vault::RecordDecodeError(key, e.what());
	}
}

}}

#endif /* !defined(VAULT_DETAIL_DECODE_RECORD_HPP) */
