#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Vault/Mod/JsonOutputter.hpp"
#include"Vault/Msg/JsonCout.hpp"

namespace Vault { namespace Mod {

JsonOutputter::JsonOutputter( std::ostream& out_
			    , S::Bus& bus
			    ) : out(out_) {
	bus.subscribe<Vault::Msg::JsonCout>([this](Vault::Msg::JsonCout const& j) {
		auto start = outs.empty();
		outs.push(j.obj.output());
		/* A writer loop is already draining the queue.  */
		if (!start)
			return Ev::lift();
		return Ev::concurrent(loop());
	});
}

Ev::Io<void> JsonOutputter::loop() {
	return Ev::yield().then([this]() {
		if (outs.empty())
			return Ev::lift();
		out << outs.front() << std::endl;
		outs.pop();
		return loop();
	});
}

}}
