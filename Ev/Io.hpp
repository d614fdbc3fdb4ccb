#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};
/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

/* Result of applying a continuation to the value of an Io<a>.  */
template<typename a, typename f>
struct ThenResult {
	using type = typename IoInner<
		typename std::result_of<f(a)>::type
	>::type;
};
template<typename f>
struct ThenResult<void, f> {
	using type = typename IoInner<
		typename std::result_of<f()>::type
	>::type;
};

/* Builds the pass function that feeds a value into
 * a continuation.
 * An exception thrown by the continuation itself fails
 * the chain; this matters when pass is invoked from C
 * code (the libev callbacks) where there is nobody else
 * to catch it.
 */
template<typename a>
struct Chain {
	template<typename b, typename f>
	static
	typename PassFunc<a>::type
	make( f func
	    , typename PassFunc<b>::type pass
	    , std::function<void (std::exception_ptr)> fail
	    ) {
		return [func, pass, fail](a value) mutable {
			try {
				func(std::move(value)).core(pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		};
	}
};
template<>
struct Chain<void> {
	template<typename b, typename f>
	static
	typename PassFunc<void>::type
	make( f func
	    , typename PassFunc<b>::type pass
	    , std::function<void (std::exception_ptr)> fail
	    ) {
		return [func, pass, fail]() {
			try {
				func().core(pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		};
	}
};

/* Wraps pass so that only the first completion of
 * a run is reported.  */
template<typename a>
struct Once {
	static
	typename PassFunc<a>::type
	wrap( std::shared_ptr<bool> completed
	    , typename PassFunc<a>::type pass
	    ) {
		return [completed, pass](a value) {
			if (!*completed) {
				*completed = true;
				pass(std::move(value));
			}
		};
	}
};
template<>
struct Once<void> {
	static
	typename PassFunc<void>::type
	wrap( std::shared_ptr<bool> completed
	    , typename PassFunc<void>::type pass
	    ) {
		return [completed, pass]() {
			if (!*completed) {
				*completed = true;
				pass();
			}
		};
	}
};

}

/** Ev::Io<a>
 *
 * @brief an action that, when run, eventually yields a
 * value of type a or fails with an exception.
 *
 * @desc Nothing happens until the action is `run`; an
 * action can be built up from smaller actions with
 * `then` and `catching`, and is normally passed to
 * `Ev::start` or `Ev::concurrent`.
 */
template<typename a>
class Io {
public:
	typedef typename Detail::PassFunc<a>::type PassFunc;
	typedef std::function<void (std::exception_ptr)> FailFunc;
	typedef std::function<void (PassFunc, FailFunc)> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;
	template<typename b>
	friend struct Detail::Chain;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::ThenResult<a, f>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<a, f>::type;
		auto core_copy = core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , FailFunc fail
			      ) {
			try {
				auto sub_pass = Detail::Chain<a>::template
					make<b>(func, pass, fail);
				core_copy(std::move(sub_pass), fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	/* Handles failures of type e by switching to the
	 * action the handler returns.
	 * Other failures pass through unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( PassFunc pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						handler(ex).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(pass, std::move(sub_fail));
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	void run( PassFunc pass
		, FailFunc fail
		) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = Detail::Once<a>::wrap(completed, std::move(pass));
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		try {
			core(std::move(sub_pass), std::move(sub_fail));
		} catch (...) {
			if (!*completed) {
				*completed = true;
				fail(std::current_exception());
			}
		}
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift(void) {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		pass();
	});
}

}

#endif /* !defined(EV_IO_HPP) */
