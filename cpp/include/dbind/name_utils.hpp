#ifndef __DBIND_NAME_UTILS_HPP
#define __DBIND_NAME_UTILS_HPP

#include <string>
#include <vector>
#include <stddef.h>

namespace dbind {

/**
 * @brief Converts an in-language snake_case name into the CamelCase form used
 * on the bus.
 *
 * The first character is capitalized. Each underscore is removed and the
 * character following it is capitalized. Runs of underscores count as one
 * and a trailing underscore is dropped. Only ASCII letters change case.
 *
 * Example: `to_wire_name("get_machine_id") == "GetMachineId"`
 */
std::string to_wire_name(const std::string& name);

// Naming grammar checks. These forward to libdbus so that the rules match
// exactly what the bus daemon enforces.
bool is_valid_interface_name(const std::string& name);
bool is_valid_member_name(const std::string& name);
bool is_valid_object_path(const std::string& path);
bool is_valid_bus_name(const std::string& name);
bool is_valid_error_name(const std::string& name);
bool is_valid_signature(const std::string& signature);
bool is_single_complete_type(const std::string& signature);

/**
 * @brief Returns the number of complete types in a valid signature (e.g. 2 for
 * "sa{sv}").
 */
size_t count_complete_types(const std::string& signature);

/** @brief Splits a valid signature into its complete types. */
std::vector<std::string> split_signature(const std::string& signature);

}

#endif // __DBIND_NAME_UTILS_HPP
