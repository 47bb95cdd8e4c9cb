#include <dbind/introspection.hpp>
#include "test_objects.hpp"
#include "mock_bus.hpp"
#include "test_utils.hpp"

#include <cctype>

using namespace dbind;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TestContext standard_interfaces_test() {
    TestContext context;

    InterfaceTablePtr peer = peer_interface();
    InterfaceTablePtr introspectable = introspectable_interface();
    InterfaceTablePtr common = common_interfaces();
    if (!TEST_NOT_NULL(peer.get()) || !TEST_NOT_NULL(introspectable.get()) || !TEST_NOT_NULL(common.get())) {
        return context;
    }

    TEST_ASSERT(!peer->serving_enabled());
    TEST_ASSERT(!introspectable->serving_enabled());

    const MethodDescriptor* ping = common->find_method("ping");
    const MethodDescriptor* machine_id = common->find_method("get_machine_id");
    const MethodDescriptor* introspect = common->find_method("introspect");
    if (TEST_NOT_NULL(ping) && TEST_NOT_NULL(machine_id) && TEST_NOT_NULL(introspect)) {
        TEST_EQUAL(ping->interface_name(), std::string{"org.freedesktop.DBus.Peer"});
        TEST_EQUAL(machine_id->name(), std::string{"GetMachineId"});
        TEST_EQUAL(machine_id->result_signature(), std::string{"s"});
        TEST_EQUAL(introspect->interface_name(), std::string{"org.freedesktop.DBus.Introspectable"});
        TEST_EQUAL(introspect->name(), std::string{"Introspect"});
    }

    // The tables are built once
    TEST_ASSERT(common_interfaces() == common);

    return context;
}

TestContext machine_id_test() {
    TestContext context;
    Counter counter;
    ReplyCatcher catcher;

    counter.method("get_machine_id").call({}, catcher.method_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)1);

    // Containers do not always have a machine ID
    if (catcher.last_status.is_error()) {
        TEST_CODE(catcher.last_status, Status::kBusError);
        return context;
    }

    const std::string* id = catcher.last_value.get_if<std::string>();
    if (TEST_NOT_NULL(id)) {
        TEST_EQUAL(id->size(), (size_t)32);
        for (char c: *id) {
            TEST_ASSERT(isxdigit((unsigned char)c));
        }
    }

    return context;
}

TestContext xml_test() {
    TestContext context;
    Counter counter;
    ReplyCatcher catcher;

    counter.method("introspect").call({}, catcher.method_cb());
    TEST_OK(catcher.last_status);
    const std::string* xml = catcher.last_value.get_if<std::string>();
    if (!TEST_NOT_NULL(xml)) {
        return context;
    }

    TEST_ASSERT(contains(*xml, "<!DOCTYPE node"));
    TEST_ASSERT(contains(*xml, "<interface name=\"org.freedesktop.DBus.Peer\">"));
    TEST_ASSERT(contains(*xml, "<interface name=\"org.freedesktop.DBus.Introspectable\">"));
    TEST_ASSERT(contains(*xml, "<interface name=\"org.example.Counter\">"));

    TEST_ASSERT(contains(*xml,
        "    <method name=\"Add\">\n"
        "      <arg name=\"a\" type=\"i\" direction=\"in\"/>\n"
        "      <arg name=\"b\" type=\"i\" direction=\"in\"/>\n"
        "      <arg name=\"sum\" type=\"i\" direction=\"out\"/>\n"
        "    </method>\n"));

    TEST_ASSERT(contains(*xml,
        "    <method name=\"Reset\">\n"
        "      <annotation name=\"org.freedesktop.DBus.Method.NoReply\" value=\"true\"/>\n"
        "    </method>\n"));

    TEST_ASSERT(contains(*xml, "<property name=\"Total\" type=\"i\" access=\"readwrite\">"));
    TEST_ASSERT(contains(*xml,
        "    <property name=\"Version\" type=\"s\" access=\"read\">\n"
        "      <annotation name=\"org.freedesktop.DBus.Property.EmitsChangedSignal\" value=\"const\"/>\n"
        "    </property>\n"));

    TEST_ASSERT(contains(*xml,
        "    <signal name=\"Changed\">\n"
        "      <arg name=\"total\" type=\"i\"/>\n"
        "    </signal>\n"));

    return context;
}

TestContext xml_details_test() {
    TestContext context;

    SignalDescriptor odd{"odd", {"a{sv}", {"<name>"}, "", kDeprecated}, "org.example.Odd", true};
    ServerInterface intf{"org.example.Odd", {}, {}, {&odd}};

    std::string xml = generate_introspection_xml({&intf, nullptr}, {"child1", "child2"});
    TEST_ASSERT(contains(xml, "<arg name=\"&lt;name&gt;\" type=\"a{sv}\"/>"));
    TEST_ASSERT(contains(xml, "<annotation name=\"org.freedesktop.DBus.Deprecated\" value=\"true\"/>"));
    TEST_ASSERT(contains(xml, "  <node name=\"child1\"/>\n  <node name=\"child2\"/>\n</node>\n"));

    std::string empty = generate_introspection_xml({}, {});
    TEST_ASSERT(contains(empty, "<node>\n</node>\n"));

    return context;
}

int main() {
    TestContext context;

    TEST_ADD(standard_interfaces_test());
    TEST_ADD(machine_id_test());
    TEST_ADD(xml_test());
    TEST_ADD(xml_details_test());

    return context.summarize();
}
