#undef NDEBUG
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Ev/yield.hpp>
#include<S/Bus.hpp>
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>

namespace {

struct Ping {
	int n;
};
struct Pong {
	std::string s;
};

}

Ev::Io<void> io_main() {
	auto bus = std::make_shared<S::Bus>();
	auto pings = std::make_shared<int>(0);
	auto pongs = std::make_shared<int>(0);
	return Ev::yield().then([=]() {
		/* Nobody listens yet; benign.  */
		return bus->raise(Ping{1});
	}).then([=]() {
		bus->subscribe<Ping>([=](Ping const& p) {
			*pings += p.n;
			return Ev::lift();
		});
		return bus->raise(Ping{2});
	}).then([=]() {
		assert(*pings == 2);
		/* Dispatch is by type.  */
		return bus->raise(Pong{"x"});
	}).then([=]() {
		assert(*pings == 2);
		bus->subscribe<Pong>([=](Pong const& p) {
			assert(p.s == "y");
			++*pongs;
			return Ev::lift();
		});
		bus->subscribe<Pong>([=](Pong const& p) {
			++*pongs;
			return Ev::yield();
		});
		return bus->raise(Pong{"y"});
	}).then([=]() {
		/* raise completes after every subscriber.  */
		assert(*pongs == 2);

		bus->subscribe<Ping>([=](Ping const&) {
			throw std::runtime_error("subscriber failed");
			return Ev::lift();
		});
		return bus->raise(Ping{3}).then([]() {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			assert(std::string(e.what()) == "subscriber failed");
			return Ev::lift(true);
		});
	}).then([=](bool failed) {
		assert(failed);
		/* The other subscriber still ran.  */
		assert(*pings == 5);
		return Ev::lift();
	});
}

int main() {
	return Ev::start(io_main().then([](){
		return Ev::lift(0);
	}));
}
