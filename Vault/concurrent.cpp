#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"S/Bus.hpp"
#include"Vault/concurrent.hpp"
#include"Vault/log.hpp"
#include<exception>

namespace Vault {

Ev::Io<void> concurrent(S::Bus& bus, Ev::Io<void> io) {
	auto pbus = &bus;
	return Ev::concurrent(io.catching<std::exception>([pbus](std::exception const& e) {
		return Vault::log( *pbus, Error
				 , "Unhandled exception in background task: %s"
				 , e.what()
				 );
	}));
}

}
