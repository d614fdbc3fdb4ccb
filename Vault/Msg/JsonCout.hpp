#ifndef VAULT_MSG_JSONCOUT_HPP
#define VAULT_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Vault { namespace Msg {

/** struct Vault::Msg::JsonCout
 *
 * @brief a JSON object to be written out, one per
 * line, by `Vault::Mod::JsonOutputter`.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(VAULT_MSG_JSONCOUT_HPP) */
