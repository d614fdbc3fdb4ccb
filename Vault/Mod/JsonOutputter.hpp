#ifndef VAULT_MOD_JSONOUTPUTTER_HPP
#define VAULT_MOD_JSONOUTPUTTER_HPP

#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Vault { namespace Mod {

/** class Vault::Mod::JsonOutputter
 *
 * @brief module that outputs Vault::Msg::JsonCout
 * objects, one per line, in the order raised.
 */
class JsonOutputter {
private:
	std::ostream& out;
	std::queue<std::string> outs;

	Ev::Io<void> loop();
public:
	JsonOutputter( std::ostream& out_
		     , S::Bus& bus
		     );
	JsonOutputter(JsonOutputter const&) =delete;
};

}}

#endif /* !defined(VAULT_MOD_JSONOUTPUTTER_HPP) */
