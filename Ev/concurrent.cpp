#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace {

/* The idler's data points back at the task.  */
struct Task {
	ev_idle idler;
	Ev::Io<void> io;

	explicit Task(Ev::Io<void> io_) : io(std::move(io_)) { }
};

void report(std::exception_ptr e) {
	std::cerr << "Unhandled exception in concurrent task!"
		  << std::endl
		  ;
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& e) {
		std::cerr << e.what() << std::endl;
	} catch (...) {
		std::cerr << "Unknown type!" << std::endl;
	}
	std::cerr << "...main loop continuing..." << std::endl;
}

void concurrent_idle_handler(EV_P_ ev_idle *raw_idler, int revents) {
	/* Recover control of the task back from C.  */
	auto task = std::unique_ptr<Task>((Task*) raw_idler->data);
	ev_idle_stop(EV_A_ &task->idler);

	auto io = std::move(task->io);
	task = nullptr;

	io.run([]() { }, &report);
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		auto task = Util::make_unique<Task>(io);
		ev_idle_init(&task->idler, &concurrent_idle_handler);
		task->idler.data = task.get();
		/* Hand over control of the task to C.  */
		ev_idle_start(EV_DEFAULT_ &task.release()->idler);
		pass();
	});
}

}
