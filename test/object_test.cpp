#include "test_objects.hpp"
#include "mock_bus.hpp"
#include "test_utils.hpp"

using namespace dbind;

TestContext local_call_test() {
    TestContext context;
    Counter counter;
    ReplyCatcher catcher;

    TEST_ASSERT(counter.mode() == Object::Mode::kUnbound);

    counter.method("add").call({Value{(int32_t)2}, Value{(int32_t)3}}, catcher.method_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)1);
    TEST_OK(catcher.last_status);
    TEST_EQUAL(catcher.last_value, Value{(int32_t)5});

    // Trailing default
    counter.method("add").call({Value{(int32_t)2}}, catcher.method_cb());
    TEST_EQUAL(catcher.last_value, Value{(int32_t)3});

    counter.method("add").call({}, {{"b", Value{(int32_t)5}}, {"a", Value{(int32_t)10}}}, catcher.method_cb());
    TEST_OK(catcher.last_status);
    TEST_EQUAL(catcher.last_value, Value{(int32_t)15});

    // Several results arrive as a struct
    counter.method("divmod").call({Value{(int32_t)7}, Value{(int32_t)2}}, catcher.method_cb());
    TEST_EQUAL(catcher.last_value, (Value{Struct{{Value{(int32_t)3}, Value{(int32_t)1}}}}));

    counter.method("greet").call({Value{"bob"}}, catcher.method_cb());
    TEST_EQUAL(catcher.last_value, Value{"hello bob"});

    counter.method("reset").call({}, catcher.method_cb());
    TEST_OK(catcher.last_status);
    TEST_ASSERT(catcher.last_value.is_null());
    TEST_EQUAL(counter.n_resets, (size_t)1);

    // Inherited standard members work locally as well
    counter.method("ping").call({}, catcher.method_cb());
    TEST_OK(catcher.last_status);

    TEST_EQUAL(catcher.n_calls, (size_t)7);
    return context;
}

TestContext local_call_error_test() {
    TestContext context;
    Counter counter;
    ReplyCatcher catcher;

    counter.method("add").call({Value{(int32_t)1}, Value{(int32_t)2}, Value{(int32_t)3}}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kArgumentError);

    counter.method("greet").call({}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kArgumentError);

    counter.method("greet").call({}, {{"nickname", Value{"x"}}}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kArgumentError);

    // Values that cannot be converted to the parameter type
    counter.method("add").call({Value{"two"}, Value{(int32_t)3}}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kInvalidArgument);

    // Errors returned by the implementation reach the caller unchanged
    counter.method("greet").call({Value{""}}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kInvalidArgument);
    TEST_EQUAL(catcher.last_status.error_name(), std::string{"org.example.Error.EmptyName"});

    counter.method("no_such_method").call({}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kInvalidArgument);

    // A property key does not resolve to a method
    TEST_ASSERT(counter.method("total").descriptor() == nullptr);

    TEST_EQUAL(catcher.n_calls, (size_t)6);
    return context;
}

TestContext deferred_reply_test() {
    TestContext context;
    Counter counter;
    ReplyCatcher catcher;

    counter.method("slow").call({Value{"in"}}, catcher.method_cb());
    TEST_ZERO(catcher.n_calls);
    TEST_ASSERT(counter.slow_args == ValueList{Value{"in"}});

    counter.finish_slow(Value{"out"});
    TEST_EQUAL(catcher.n_calls, (size_t)1);
    TEST_EQUAL(catcher.last_value, Value{"out"});

    return context;
}

TestContext dispatch_test() {
    TestContext context;
    Counter counter;
    ReplyCatcher catcher;

    counter.method("explode").dispatch({}, catcher.method_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)1);
    TEST_CODE(catcher.last_status, Status::kFailed);

    // Only the first reply counts
    counter.method("reply_then_explode").dispatch({}, catcher.method_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)2);
    TEST_OK(catcher.last_status);
    TEST_EQUAL(catcher.last_value, Value{"early"});

    // A reply that arrives after dispatch() returned is forwarded too
    counter.method("slow").dispatch({Value{"later"}}, catcher.method_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)2);
    counter.finish_slow(Value{"done"});
    TEST_EQUAL(catcher.n_calls, (size_t)3);
    TEST_EQUAL(catcher.last_value, Value{"done"});

    return context;
}

TestContext property_test() {
    TestContext context;
    Counter counter;
    Value value;

    TEST_OK(counter.property("total").get_sync(&value));
    TEST_EQUAL(value, Value{(int32_t)0});

    TEST_OK(counter.property("total").set_sync(Value{(int32_t)12}));
    TEST_EQUAL(counter.total(), 12);

    TEST_CODE(counter.property("total").set_sync(Value{(int32_t)-1}), Status::kInvalidArgument);
    TEST_CODE(counter.property("total").set_sync(Value{"12"}), Status::kInvalidArgument);
    TEST_EQUAL(counter.total(), 12);

    TEST_OK(counter.property("version").get_sync(&value));
    TEST_EQUAL(value, Value{"1.0"});
    TEST_CODE(counter.property("version").set_sync(Value{"2.0"}), Status::kNoSetter);

    TEST_CODE(counter.property("add").get_sync(&value), Status::kInvalidArgument);

    // The asynchronous variants complete immediately on local objects
    ReplyCatcher catcher;
    counter.property("total").get_async(catcher.value_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)1);
    TEST_EQUAL(catcher.last_value, Value{(int32_t)12});

    counter.property("total").set_async(Value{(int32_t)4}, catcher.status_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)2);
    TEST_OK(catcher.last_status);
    TEST_EQUAL(counter.total(), 4);

    counter.property("version").set_async(Value{"2.0"}, catcher.status_cb());
    TEST_CODE(catcher.last_status, Status::kNoSetter);

    return context;
}

/**
 * @brief Destroys another queue when it receives a value.
 */
struct QueueCloser {
    std::unique_ptr<SignalQueue>* victim;
    size_t n_values = 0;

    void on_value(Value) {
        n_values++;
        victim->reset();
    }
};

TestContext local_signal_test() {
    TestContext context;
    Counter counter;
    BoundSignal changed = counter.signal("changed");

    // Emitting without subscribers is fine
    TEST_OK(changed.emit(Value{(int32_t)1}));

    std::unique_ptr<SignalQueue> queue1, queue2;
    TEST_OK(changed.subscribe(&queue1));
    TEST_OK(changed.subscribe(&queue2));

    TEST_OK(changed.emit(Value{(int32_t)2}));
    TEST_OK(changed.emit(Value{(int32_t)3}));
    TEST_EQUAL(queue1->backlog(), (size_t)2);
    TEST_EQUAL(queue2->backlog(), (size_t)2);

    // Queued payloads are delivered in order
    ReplyCatcher catcher;
    TEST_OK(queue1->next(catcher.signal_cb()));
    TEST_OK(queue1->next(catcher.signal_cb()));
    TEST_ASSERT(catcher.values == (ValueList{Value{(int32_t)2}, Value{(int32_t)3}}));

    // A waiting reader gets the next payload directly
    TEST_OK(queue1->next(catcher.signal_cb()));
    TEST_CODE(queue1->next(catcher.signal_cb()), Status::kInvalidState);
    TEST_OK(changed.emit(Value{(int32_t)4}));
    TEST_EQUAL(catcher.last_value, Value{(int32_t)4});
    TEST_ZERO(queue1->backlog());

    // cancel_next() withdraws the reader but keeps the subscription
    TEST_OK(queue1->next(catcher.signal_cb()));
    queue1->cancel_next();
    TEST_OK(changed.emit(Value{(int32_t)5}));
    TEST_EQUAL(catcher.values.size(), (size_t)3);
    TEST_EQUAL(queue1->backlog(), (size_t)1);

    // Dropping a queue unsubscribes it
    queue2.reset();
    TEST_OK(changed.emit(Value{(int32_t)6}));
    TEST_EQUAL(queue1->backlog(), (size_t)2);

    // A method key does not resolve to a signal
    TEST_CODE(counter.signal("add").emit(Value{}), Status::kInvalidArgument);

    return context;
}

TestContext fan_out_mutation_test() {
    TestContext context;
    Counter counter;
    BoundSignal changed = counter.signal("changed");

    std::unique_ptr<SignalQueue> first, second;
    TEST_OK(changed.subscribe(&first));
    TEST_OK(changed.subscribe(&second));

    QueueCloser closer{&second};
    TEST_OK(first->next(MEMBER_CB(&closer, on_value)));

    // The first subscriber closes the second one while the signal is fanned out
    TEST_OK(changed.emit(Value{(int32_t)1}));
    TEST_EQUAL(closer.n_values, (size_t)1);
    TEST_ASSERT(!second);

    TEST_OK(changed.emit(Value{(int32_t)2}));
    TEST_EQUAL(first->backlog(), (size_t)1);

    return context;
}

TestContext queue_outlives_object_test() {
    TestContext context;
    std::unique_ptr<SignalQueue> queue;

    {
        Counter counter;
        TEST_OK(counter.signal("changed").subscribe(&queue));
        TEST_OK(counter.signal("changed").emit(Value{(int32_t)1}));
    }

    // The queue keeps what it received and can still be destroyed safely
    TEST_EQUAL(queue->backlog(), (size_t)1);
    queue.reset();

    return context;
}

TestContext unbound_object_test() {
    TestContext context;
    Object empty{nullptr};
    ReplyCatcher catcher;

    TEST_ZERO(empty.table().members().size());
    empty.method("anything").call({}, catcher.method_cb());
    TEST_CODE(catcher.last_status, Status::kInvalidArgument);
    TEST_ZERO(empty.describe_interfaces(true).size());

    return context;
}

TestContext shared_descriptor_test() {
    TestContext context;
    Counter first;
    Counter second;
    MockBus bus;
    ReplyCatcher catcher;

    // Both instances use the descriptors of the same class table
    TEST_ASSERT(first.method("add").descriptor() == second.method("add").descriptor());
    TEST_ASSERT(first.property("total").descriptor() == second.property("total").descriptor());
    TEST_ASSERT(first.signal("changed").descriptor() == second.signal("changed").descriptor());

    // Binding one instance leaves the other untouched
    if (!TEST_OK(first.connect(&bus, "org.example.CounterService", "/org/example/counter"))) {
        return context;
    }
    TEST_ASSERT(first.is_proxy());
    TEST_ASSERT(second.mode() == Object::Mode::kUnbound);

    second.method("add").call({Value{(int32_t)2}, Value{(int32_t)3}}, catcher.method_cb());
    TEST_OK(catcher.last_status);
    TEST_EQUAL(catcher.last_value, Value{(int32_t)5});
    TEST_ZERO(bus.calls.size());

    first.method("add").call({Value{(int32_t)2}, Value{(int32_t)3}}, catcher.method_cb());
    TEST_EQUAL(catcher.n_calls, (size_t)1);
    if (TEST_EQUAL(bus.calls.size(), (size_t)1)) {
        bus.reply(0, RichStatus::success(), {Value{(int32_t)5}});
        TEST_EQUAL(catcher.n_calls, (size_t)2);
        TEST_EQUAL(catcher.last_value, Value{(int32_t)5});
    }

    return context;
}

int main() {
    TestContext context;

    TEST_ADD(local_call_test());
    TEST_ADD(local_call_error_test());
    TEST_ADD(deferred_reply_test());
    TEST_ADD(dispatch_test());
    TEST_ADD(property_test());
    TEST_ADD(local_signal_test());
    TEST_ADD(fan_out_mutation_test());
    TEST_ADD(queue_outlives_object_test());
    TEST_ADD(unbound_object_test());
    TEST_ADD(shared_descriptor_test());

    return context.summarize();
}
