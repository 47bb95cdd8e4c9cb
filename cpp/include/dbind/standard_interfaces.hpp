#ifndef __DBIND_STANDARD_INTERFACES_HPP
#define __DBIND_STANDARD_INTERFACES_HPP

#include <dbind/interface.hpp>

namespace dbind {

/**
 * @brief org.freedesktop.DBus.Peer with the members `ping` and
 * `get_machine_id`. Serving is disabled.
 */
InterfaceTablePtr peer_interface();

/**
 * @brief org.freedesktop.DBus.Introspectable with the member `introspect`.
 * Serving is disabled.
 */
InterfaceTablePtr introspectable_interface();

/**
 * @brief Union of peer_interface() and introspectable_interface(). Every
 * application interface should inherit this.
 */
InterfaceTablePtr common_interfaces();

}

#endif // __DBIND_STANDARD_INTERFACES_HPP
