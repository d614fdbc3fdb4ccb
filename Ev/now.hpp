#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief returns the time the main loop last woke up,
 * in seconds from the epoch.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
