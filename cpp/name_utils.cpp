#include <dbind/name_utils.hpp>
#include <dbus/dbus.h>
#include <ctype.h>

using namespace dbind;

std::string dbind::to_wire_name(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    bool capitalize_next = true;

    for (char c: name) {
        if (c == '_') {
            capitalize_next = true;
            continue;
        }
        if (capitalize_next && c >= 'a' && c <= 'z') {
            result.push_back((char)(c - 'a' + 'A'));
        } else {
            result.push_back(c);
        }
        capitalize_next = false;
    }

    return result;
}

bool dbind::is_valid_interface_name(const std::string& name) {
    return dbus_validate_interface(name.c_str(), nullptr);
}

bool dbind::is_valid_member_name(const std::string& name) {
    return dbus_validate_member(name.c_str(), nullptr);
}

bool dbind::is_valid_object_path(const std::string& path) {
    return dbus_validate_path(path.c_str(), nullptr);
}

bool dbind::is_valid_bus_name(const std::string& name) {
    return dbus_validate_bus_name(name.c_str(), nullptr);
}

bool dbind::is_valid_error_name(const std::string& name) {
    return dbus_validate_error_name(name.c_str(), nullptr);
}

bool dbind::is_valid_signature(const std::string& signature) {
    return dbus_signature_validate(signature.c_str(), nullptr);
}

bool dbind::is_single_complete_type(const std::string& signature) {
    return dbus_signature_validate_single(signature.c_str(), nullptr);
}

size_t dbind::count_complete_types(const std::string& signature) {
    if (signature.empty() || !is_valid_signature(signature)) {
        return 0;
    }

    DBusSignatureIter iter;
    dbus_signature_iter_init(&iter, signature.c_str());
    size_t n = 1;
    while (dbus_signature_iter_next(&iter)) {
        n++;
    }
    return n;
}

std::vector<std::string> dbind::split_signature(const std::string& signature) {
    std::vector<std::string> result;
    if (signature.empty() || !is_valid_signature(signature)) {
        return result;
    }

    DBusSignatureIter iter;
    dbus_signature_iter_init(&iter, signature.c_str());
    do {
        char* sig = dbus_signature_iter_get_signature(&iter);
        if (sig) {
            result.push_back(sig);
            dbus_free(sig);
        }
    } while (dbus_signature_iter_next(&iter));
    return result;
}
