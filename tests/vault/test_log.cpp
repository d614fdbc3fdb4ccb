#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"S/Bus.hpp"
#include"Vault/Mod/JsonOutputter.hpp"
#include"Vault/concurrent.hpp"
#include"Vault/log.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

std::vector<Jsmn::Object> lines(std::string const& text) {
	auto ret = std::vector<Jsmn::Object>();
	auto is = std::istringstream(text);
	auto line = std::string();
	while (std::getline(is, line))
		ret.push_back(Jsmn::Object::parse_json(line));
	return ret;
}

}

int main() {
	auto bus = S::Bus();
	auto out = std::ostringstream();
	auto outputter = Vault::Mod::JsonOutputter(out, bus);

	auto code = Ev::lift().then([&]() {
		return Vault::log(bus, Vault::Info, "first %d", 1);
	}).then([&]() {
		return Vault::log(bus, Vault::Trace, "%s", "second \"quoted\"");
	}).then([&]() {
		return Vault::concurrent(bus, Ev::yield().then([]() {
			throw std::runtime_error("task failed");
			return Ev::lift();
		}));
	}).then([&]() {
		return Ev::yield(20);
	}).then([&]() {
		auto ls = lines(out.str());
		assert(ls.size() == 3);

		assert(std::string(ls[0]["jsonrpc"]) == "2.0");
		assert(std::string(ls[0]["method"]) == "log");
		assert(std::string(ls[0]["params"]["level"]) == "info");
		assert(std::string(ls[0]["params"]["message"]) == "first 1");

		assert(std::string(ls[1]["params"]["level"]) == "debug");
		assert(std::string(ls[1]["params"]["message"])
		       == "second \"quoted\"");

		/* A failed background task is logged,
		 * and goes no further.  */
		assert(std::string(ls[2]["params"]["level"]) == "error");
		auto msg = std::string(ls[2]["params"]["message"]);
		assert(msg.find("task failed") != std::string::npos);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
