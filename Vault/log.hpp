#ifndef VAULT_LOG_HPP
#define VAULT_LOG_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Vault {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/** Vault::log
 *
 * @brief formats a log line printf-style and
 * broadcasts it as a `Vault::Msg::JsonCout`
 * carrying a JSON-RPC `log` notification.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* !defined(VAULT_LOG_HPP) */
