#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#if !ENABLE_EXCEPTION_BACKTRACE // If not enabled or undefined

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief A do-nothing wrapper when backtraces are disabled.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

}

#else // ENABLE_EXCEPTION_BACKTRACE in force

#include<cstddef>
#include<execinfo.h>
#include<iomanip>
#include<sstream>
#include<stdlib.h>
#include<string>
#include<utility>
#include<vector>

#define UNW_LOCAL_ONLY
#include<libunwind.h>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief A wrapper for an exception E which additionally stores a
 * backtrace when it is constructed.
 *
 * @desc The frames are captured with libunwind; symbolizing them
 * is deferred until `what()` is called on the handled exception.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...)
		, formatted(false)
		, full_message(T::what()) {
		capture();
	}

	const char* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			full_message = std::string(T::what())
				     + "\nBacktrace:\n"
				     + format()
				     ;
		}
		return full_message.c_str();
	}

private:
	static constexpr std::size_t max_frames = 100;
	mutable bool formatted;
	mutable std::string full_message;
	std::vector<void*> frames;

	void capture() {
		unw_cursor_t cursor;
		unw_context_t context;
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);

		while (unw_step(&cursor) > 0 && frames.size() < max_frames) {
			unw_word_t ip;
			unw_get_reg(&cursor, UNW_REG_IP, &ip);
			frames.push_back(reinterpret_cast<void*>(ip));
		}
	}

	std::string format() const {
		if (frames.empty())
			return "";
		auto symbols = backtrace_symbols(frames.data(), int(frames.size()));
		auto os = std::ostringstream();
		for (auto i = std::size_t(0); i < frames.size(); ++i) {
			os << '#' << std::left << std::setfill(' ')
			   << std::setw(2) << i << ' ';
			if (symbols)
				os << symbols[i];
			else
				os << frames[i];
			os << std::endl;
		}
		free(symbols);
		return os.str();
	}
};

}

#endif // ENABLE_EXCEPTION_BACKTRACE

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
