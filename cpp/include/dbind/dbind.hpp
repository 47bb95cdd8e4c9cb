#ifndef __DBIND_HPP
#define __DBIND_HPP

#include <dbind/config.hpp>
#include <dbind/adapters.hpp>
#include <dbind/bus.hpp>
#include <dbind/event_loop.hpp>
#include <dbind/interface.hpp>
#include <dbind/logging.hpp>
#include <dbind/object.hpp>
#include <dbind/standard_interfaces.hpp>

namespace dbind {

/**
 * @brief Launches an event loop on the current thread.
 *
 * This function returns when the event loop becomes empty, that is when no
 * bus is open anymore and no callbacks are pending.
 *
 * Returns an error if dbind was compiled with DBIND_ENABLE_EVENT_LOOP=0.
 *
 * @param on_started: This function is the first event that is placed on the
 *        event loop. This function usually opens a bus, for instance by
 *        calling get_default_bus().
 */
RichStatus launch_event_loop(Logger logger, Callback<void, EventLoop*> on_started);

}

#endif // __DBIND_HPP
