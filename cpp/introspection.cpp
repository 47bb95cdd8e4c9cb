#include <dbind/introspection.hpp>
#include <dbind/name_utils.hpp>
#include <dbus/dbus.h>

#include <sstream>

using namespace dbind;

static std::string xml_escape(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c: str) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            default: result.push_back(c); break;
        }
    }
    return result;
}

static void write_args(std::ostream& stream, const std::string& signature,
                       const std::vector<std::string>& names, const char* direction) {
    std::vector<std::string> types = split_signature(signature);
    for (size_t i = 0; i < types.size(); ++i) {
        stream << "      <arg";
        if (i < names.size() && !names[i].empty()) {
            stream << " name=\"" << xml_escape(names[i]) << "\"";
        }
        stream << " type=\"" << xml_escape(types[i]) << "\"";
        if (direction) {
            stream << " direction=\"" << direction << "\"";
        }
        stream << "/>\n";
    }
}

static void write_annotation(std::ostream& stream, const char* name, const char* value) {
    stream << "      <annotation name=\"" << name << "\" value=\"" << value << "\"/>\n";
}

static void write_common_annotations(std::ostream& stream, uint32_t flags) {
    if (flags & kDeprecated) {
        write_annotation(stream, "org.freedesktop.DBus.Deprecated", "true");
    }
}

static void write_interface(std::ostream& stream, const ServerInterface& intf) {
    stream << "  <interface name=\"" << xml_escape(intf.name) << "\">\n";

    for (auto& method: intf.methods) {
        const MethodDescriptor* desc = method.descriptor;
        stream << "    <method name=\"" << xml_escape(desc->name()) << "\">\n";
        write_args(stream, desc->input_signature(), desc->arg_names(), "in");
        write_args(stream, desc->result_signature(), desc->result_arg_names(), "out");
        write_common_annotations(stream, desc->flags());
        if (desc->flags() & kNoReply) {
            write_annotation(stream, "org.freedesktop.DBus.Method.NoReply", "true");
        }
        stream << "    </method>\n";
    }

    for (auto& property: intf.properties) {
        const PropertyDescriptor* desc = property.descriptor;
        stream << "    <property name=\"" << xml_escape(desc->name()) << "\""
               << " type=\"" << xml_escape(desc->signature()) << "\""
               << " access=\"" << (desc->is_writable() ? "readwrite" : "read") << "\">\n";
        write_common_annotations(stream, desc->flags());
        if (desc->flags() & kPropertyConst) {
            write_annotation(stream, "org.freedesktop.DBus.Property.EmitsChangedSignal", "const");
        } else if (desc->flags() & kPropertyEmitsInvalidation) {
            write_annotation(stream, "org.freedesktop.DBus.Property.EmitsChangedSignal", "invalidates");
        } else if (desc->flags() & kPropertyNoEmit) {
            write_annotation(stream, "org.freedesktop.DBus.Property.EmitsChangedSignal", "false");
        }
        stream << "    </property>\n";
    }

    for (const SignalDescriptor* desc: intf.signals) {
        stream << "    <signal name=\"" << xml_escape(desc->name()) << "\">\n";
        write_args(stream, desc->signature(), desc->arg_names(), nullptr);
        write_common_annotations(stream, desc->flags());
        stream << "    </signal>\n";
    }

    stream << "  </interface>\n";
}

std::string dbind::generate_introspection_xml(const std::vector<const ServerInterface*>& interfaces,
                                              const std::vector<std::string>& child_nodes) {
    std::ostringstream stream;
    stream << DBUS_INTROSPECT_1_0_XML_DOCTYPE_DECL_NODE;
    stream << "<node>\n";
    for (const ServerInterface* intf: interfaces) {
        if (intf) {
            write_interface(stream, *intf);
        }
    }
    for (auto& child: child_nodes) {
        stream << "  <node name=\"" << xml_escape(child) << "\"/>\n";
    }
    stream << "</node>\n";
    return stream.str();
}
