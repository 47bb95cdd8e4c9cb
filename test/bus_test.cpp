#include <dbind/dbind.hpp>
#include "platform_support/libdbus_bus.hpp"
#include "test_objects.hpp"
#include "test_utils.hpp"

using namespace dbind;

static const char* kPath = "/org/example/counter";
static const char* kInterface = "org.example.Counter";

/**
 * @brief Serves a Counter on one session bus connection and talks to it
 * through a proxy and raw calls on a second connection.
 *
 * Each step starts one request. Its reply is stored and the next step is
 * posted to the event loop, so the whole sequence runs on the loop thread.
 */
struct BusTest {
    Logger logger{{log_to_stderr, nullptr}, get_log_verbosity()};
    EventLoop* event_loop = nullptr;
    LibDBusBus server_bus;
    LibDBusBus client_bus;
    Counter counter;
    Counter proxy;
    size_t step = 0;

    RichStatus setup_status = RichStatus::success();
    RichStatus teardown_status = RichStatus::success();

    RichStatus add_status;
    Value add_result;
    RichStatus greet_status;
    RichStatus get_status;
    Value get_result;
    RichStatus set_status;
    RichStatus read_only_status;
    RichStatus get_all_status;
    ValueList get_all_result;
    RichStatus mismatch_status;
    RichStatus unknown_method_status;

    void on_started(EventLoop* loop) {
        event_loop = loop;

        setup_status = server_bus.open(loop, logger, DBUS_BUS_SESSION);
        if (setup_status.is_success()) {
            setup_status = client_bus.open(loop, logger, DBUS_BUS_SESSION);
        }
        if (setup_status.is_success()) {
            setup_status = counter.start_serving(&server_bus, kPath);
        }
        if (setup_status.is_success()) {
            setup_status = proxy.connect(&client_bus, server_bus.unique_name(), kPath);
        }

        if (setup_status.is_error()) {
            teardown();
            return;
        }
        run_step();
    }

    MethodCall raw_call(std::string interface_name, std::string member, std::string signature, ValueList args) {
        return {server_bus.unique_name(), kPath, std::move(interface_name), std::move(member),
                std::move(signature), std::move(args)};
    }

    void run_step() {
        RichStatus status;

        switch (step++) {
            case 0:
                proxy.method("add").call({Value{(int32_t)2}, Value{(int32_t)3}}, MEMBER_CB(this, on_add));
                break;
            case 1:
                proxy.method("greet").call({Value{""}}, MEMBER_CB(this, on_greet));
                break;
            case 2:
                proxy.property("total").set_async(Value{(int32_t)7}, MEMBER_CB(this, on_set));
                break;
            case 3:
                proxy.property("total").get_async(MEMBER_CB(this, on_get));
                break;
            case 4:
                status = client_bus.call_async(raw_call(DBUS_INTERFACE_PROPERTIES, "Set", "ssv",
                        {Value{kInterface}, Value{"Version"}, Value{Variant{"s", Value{"2.0"}}}}),
                        MEMBER_CB(this, on_read_only));
                break;
            case 5:
                status = client_bus.call_async(raw_call(DBUS_INTERFACE_PROPERTIES, "GetAll", "s", {Value{kInterface}}),
                        MEMBER_CB(this, on_get_all));
                break;
            case 6:
                status = client_bus.call_async(raw_call(kInterface, "Add", "ss", {Value{"two"}, Value{"three"}}),
                        MEMBER_CB(this, on_mismatch));
                break;
            case 7:
                status = client_bus.call_async(raw_call(kInterface, "Subtract", "", {}),
                        MEMBER_CB(this, on_unknown_method));
                break;
            default:
                teardown();
                return;
        }

        if (status.is_error()) {
            setup_status = D_AMEND_ERR(status, "step " << (step - 1) << " failed to start");
            teardown();
        }
    }

    void next() {
        RichStatus status = event_loop->post(MEMBER_CB(this, run_step));
        if (status.is_error()) {
            setup_status = status;
            teardown();
        }
    }

    void on_add(RichStatus status, Value value) {
        add_status = status;
        add_result = std::move(value);
        next();
    }

    void on_greet(RichStatus status, Value) {
        greet_status = status;
        next();
    }

    void on_set(RichStatus status) {
        set_status = status;
        next();
    }

    void on_get(RichStatus status, Value value) {
        get_status = status;
        get_result = std::move(value);
        next();
    }

    void on_read_only(RichStatus status, ValueList) {
        read_only_status = status;
        next();
    }

    void on_get_all(RichStatus status, ValueList values) {
        get_all_status = status;
        get_all_result = std::move(values);
        next();
    }

    void on_mismatch(RichStatus status, ValueList) {
        mismatch_status = status;
        next();
    }

    void on_unknown_method(RichStatus status, ValueList) {
        unknown_method_status = status;
        next();
    }

    void teardown() {
        counter.stop_serving();
        if (server_bus.get_libdbus_ptr()) {
            teardown_status = server_bus.close();
        }
        if (client_bus.get_libdbus_ptr()) {
            RichStatus status = client_bus.close();
            if (status.is_error()) {
                teardown_status = status;
            }
        }
    }
};

static const Value* find_entry(const ValueList& reply, const std::string& key) {
    const Dict* dict = reply.size() == 1 ? reply[0].get_if<Dict>() : nullptr;
    if (!dict) {
        return nullptr;
    }
    for (auto& entry: dict->entries) {
        if (entry.key == Value{key}) {
            return &entry.value;
        }
    }
    return nullptr;
}

TestContext session_bus_test() {
    TestContext context;
    BusTest test;

    TEST_OK(launch_event_loop(test.logger, MEMBER_CB(&test, on_started)));
    if (!TEST_OK(test.setup_status)) {
        return context;
    }
    TEST_OK(test.teardown_status);
    TEST_EQUAL(test.step, (size_t)9);

    TEST_OK(test.add_status);
    TEST_EQUAL(test.add_result, Value{(int32_t)5});

    // Errors raised by the implementation keep their error name on the wire
    TEST_CODE(test.greet_status, Status::kRemoteError);
    TEST_EQUAL(test.greet_status.error_name(), std::string{"org.example.Error.EmptyName"});

    TEST_OK(test.set_status);
    TEST_EQUAL(test.counter.total(), 7);
    TEST_OK(test.get_status);
    TEST_EQUAL(test.get_result, Value{(int32_t)7});

    TEST_CODE(test.read_only_status, Status::kRemoteError);
    TEST_EQUAL(test.read_only_status.error_name(), std::string{DBUS_ERROR_PROPERTY_READ_ONLY});
    TEST_EQUAL(test.counter.version(), std::string{"1.0"});

    if (TEST_OK(test.get_all_status)) {
        const Value* total = find_entry(test.get_all_result, "Total");
        const Value* version = find_entry(test.get_all_result, "Version");
        if (TEST_NOT_NULL(total)) {
            TEST_EQUAL(*total, (Value{Variant{"i", Value{(int32_t)7}}}));
        }
        if (TEST_NOT_NULL(version)) {
            TEST_EQUAL(*version, (Value{Variant{"s", Value{"1.0"}}}));
        }
    }

    TEST_CODE(test.mismatch_status, Status::kRemoteError);
    TEST_EQUAL(test.mismatch_status.error_name(), std::string{DBUS_ERROR_INVALID_ARGS});

    TEST_CODE(test.unknown_method_status, Status::kRemoteError);
    TEST_EQUAL(test.unknown_method_status.error_name(), std::string{DBUS_ERROR_UNKNOWN_METHOD});

    return context;
}

int main() {
    TestContext context;

    TEST_ADD(session_bus_test());

    return context.summarize();
}
