#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the libev main loop with the given
 * action as its first greenthread.
 *
 * @return the exit code the action yields, 254 if
 * it fails, or 255 if the loop could not be
 * initialized.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
