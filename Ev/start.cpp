#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include<ev.h>
#include<iostream>
#include<memory>

namespace {

/* Holds the idler that launches the main action,
 * along with the action and the exit code it yields.  */
struct MainContainer {
	ev_idle idler;
	int exit_code;
	std::unique_ptr<Ev::Io<int>> main;
};

void start_idle_handler(EV_P_ ev_idle *raw_idler, int revents) {
	auto containerp = (MainContainer*) raw_idler->data;
	ev_idle_stop(EV_A_ &containerp->idler);

	auto main = std::move(containerp->main);
	main->run([containerp](int exit_code) {
		containerp->exit_code = exit_code;
	}, [containerp](std::exception_ptr e) {
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& e) {
			std::cerr << "Unhandled exception!" << std::endl;
			std::cerr << e.what() << std::endl;
		} catch (...) {
			std::cerr << "Unhandled exception of unknown type!"
				  << std::endl;
		}
		containerp->exit_code = 254;
	});
}

}

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "libev failed to initialize" << std::endl;
		return 255;
	}

	auto container = MainContainer();
	container.exit_code = 255;
	container.main = std::unique_ptr<Io<int>>(new Io<int>(std::move(main)));
	ev_idle_init(&container.idler, &start_idle_handler);
	container.idler.data = &container;
	ev_idle_start(EV_DEFAULT_ &container.idler);

	/* Returns once nothing is left to do.  */
	auto result = ev_run(EV_DEFAULT_ 0);
	if (result)
		std::cerr << "WARNING: libev waiters still active." << std::endl;

	return container.exit_code;
}

}
