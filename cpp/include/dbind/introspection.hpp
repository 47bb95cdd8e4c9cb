#ifndef __DBIND_INTROSPECTION_HPP
#define __DBIND_INTROSPECTION_HPP

#include <dbind/bus.hpp>

#include <string>
#include <vector>

namespace dbind {

/**
 * @brief Generates the org.freedesktop.DBus.Introspectable XML document for
 * one object path.
 *
 * @param interfaces: The interfaces available at the path. Null entries are
 *        skipped.
 * @param child_nodes: Names of the direct children of the path (relative,
 *        without leading slash).
 */
std::string generate_introspection_xml(const std::vector<const ServerInterface*>& interfaces,
                                       const std::vector<std::string>& child_nodes);

}

#endif // __DBIND_INTROSPECTION_HPP
