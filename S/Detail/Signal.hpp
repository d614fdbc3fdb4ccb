#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Registers callbacks for a particular type a, and
 * broadcasts to all callbacks.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	typedef std::vector<Callback> Callbacks;

	/* Replaced, never mutated, so a raise in progress
	 * keeps the subscriber set it started with.  */
	std::shared_ptr<Callbacks const> callbacks;

	/* State shared by the greenthreads of one raise.  */
	struct RaiseData {
		std::shared_ptr<a const> value;
		std::shared_ptr<Callbacks const> callbacks;
		std::size_t running;
		std::exception_ptr exc;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		void finish_one(std::exception_ptr e) {
			if (e && !exc)
				exc = e;
			--running;
			if (running != 0)
				return;
			auto my_pass = std::move(pass);
			auto my_fail = std::move(fail);
			if (exc)
				my_fail(exc);
			else
				my_pass();
		}
	};

	static
	Ev::Io<void> launch( std::shared_ptr<RaiseData> pdata
			   , std::size_t i
			   ) {
		auto action = Ev::Io<void>([pdata, i]( std::function<void()> pass
						     , std::function<void(std::exception_ptr)> _
						     ) {
			auto io = Ev::lift().then([pdata, i]() {
				return (*pdata->callbacks)[i](*pdata->value);
			});
			io.run([pdata, pass]() {
				pass();
				pdata->finish_one(nullptr);
			}, [pdata, pass](std::exception_ptr e) {
				pass();
				pdata->finish_one(e);
			});
		});
		return Ev::concurrent(std::move(action));
	}

public:
	Signal() : callbacks(std::make_shared<Callbacks const>()) { }

	/* Starts every subscriber in its own greenthread
	 * and completes once all of them have completed.
	 * Fails with the first failure any of them had.
	 */
	Ev::Io<void> raise(a value) {
		auto pdata = std::make_shared<RaiseData>();
		pdata->value = std::make_shared<a const>(std::move(value));
		pdata->callbacks = callbacks;
		/* The extra count belongs to this greenthread,
		 * released once every subscriber is launched.  */
		pdata->running = pdata->callbacks->size() + 1;

		auto act = Ev::yield();
		for (auto i = std::size_t(0); i < pdata->callbacks->size(); ++i)
			act = act.then([pdata, i]() {
				return launch(pdata, i);
			});
		return act.then([pdata]() {
			return Ev::Io<void>([pdata]( std::function<void()> pass
						   , std::function<void(std::exception_ptr)> fail
						   ) {
				pdata->pass = std::move(pass);
				pdata->fail = std::move(fail);
				pdata->finish_one(nullptr);
			});
		});
	}

	void subscribe(Callback callback) {
		if (!callback)
			return;
		auto ncallbacks = std::make_shared<Callbacks>(*callbacks);
		ncallbacks->push_back(std::move(callback));
		callbacks = std::move(ncallbacks);
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
