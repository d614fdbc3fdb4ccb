#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Vault/Msg/JsonCout.hpp"
#include"Vault/log.hpp"
#include<stdarg.h>

namespace {

char const* level_name(Vault::LogLevel l) {
	switch (l) {
	/* JSON-RPC log consumers know no "trace".  */
	case Vault::Trace: return "debug";
	case Vault::Debug: return "debug";
	case Vault::Info: return "info";
	case Vault::Warn: return "warn";
	case Vault::Error: return "error";
	}
	return "info";
}

}

namespace Vault {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	auto js = Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("method", std::string("log"))
			.start_object("params")
				.field("level", std::string(level_name(l)))
				.field("message", msg)
			.end_object()
		.end_object()
		;

	return bus.raise(Vault::Msg::JsonCout{std::move(js)});
}

}
