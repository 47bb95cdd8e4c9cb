#include <dbind/standard_interfaces.hpp>
#include <dbind/introspection.hpp>
#include <dbind/object.hpp>
#include <dbus/dbus.h>
#include <iostream>

using namespace dbind;

static void ping(Object*, const ValueList&, MethodReply on_reply) {
    on_reply.invoke(RichStatus::success(), Value{});
}

static void get_machine_id(Object*, const ValueList&, MethodReply on_reply) {
    DBusError err;
    dbus_error_init(&err);
    char* id = dbus_try_get_local_machine_id(&err);
    if (!id) {
        RichStatus status = D_MAKE_ERR_CODE(Status::kBusError, "could not read the machine ID: " << (err.message ? err.message : "unknown error"));
        dbus_error_free(&err);
        on_reply.invoke(status, Value{});
        return;
    }
    std::string result = id;
    dbus_free(id);
    on_reply.invoke(RichStatus::success(), Value{std::move(result)});
}

static void introspect(Object* obj, const ValueList&, MethodReply on_reply) {
    std::vector<ServerInterface> interfaces = obj->describe_interfaces(true);
    std::vector<const ServerInterface*> ptrs;
    for (auto& intf: interfaces) {
        ptrs.push_back(&intf);
    }
    on_reply.invoke(RichStatus::success(), Value{generate_introspection_xml(ptrs, {})});
}

static InterfaceTablePtr build_or_log(const InterfaceBuilder& builder, const char* name) {
    RichStatusOr<InterfaceTablePtr> table = builder.build();
    if (!table.has_value()) {
        std::cerr << "failed to declare " << name << ": " << table.status() << std::endl;
        return nullptr;
    }
    return table.value();
}

InterfaceTablePtr dbind::peer_interface() {
    static InterfaceTablePtr table = build_or_log(
        InterfaceBuilder{DBUS_INTERFACE_PEER, false}
            .method("ping", {"", "", {}, {}}, &ping)
            .method("get_machine_id", {"", "s", {}, {"machine_uuid"}}, &get_machine_id),
        DBUS_INTERFACE_PEER);
    return table;
}

InterfaceTablePtr dbind::introspectable_interface() {
    static InterfaceTablePtr table = build_or_log(
        InterfaceBuilder{DBUS_INTERFACE_INTROSPECTABLE, false}
            .method("introspect", {"", "s", {}, {"xml_data"}}, &introspect),
        DBUS_INTERFACE_INTROSPECTABLE);
    return table;
}

InterfaceTablePtr dbind::common_interfaces() {
    static InterfaceTablePtr table = build_or_log(
        InterfaceBuilder{}
            .inherit(peer_interface())
            .inherit(introspectable_interface()),
        "common interfaces");
    return table;
}
