#ifndef __DBIND_TEST_OBJECTS_HPP
#define __DBIND_TEST_OBJECTS_HPP

#include <dbind/adapters.hpp>
#include <dbind/standard_interfaces.hpp>

#include <iostream>
#include <stdexcept>

/**
 * @brief Small object with one member of every flavor, used by the object,
 * proxy and server tests.
 */
class Counter : public dbind::Object {
public:
    Counter() : dbind::Object(table()) {}

    static dbind::InterfaceTablePtr table();

    int32_t add(int32_t a, int32_t b) { return a + b; }

    dbind::RichStatusOr<std::string> greet(std::string name) {
        if (name.empty()) {
            return D_MAKE_ERR_CODE(dbind::Status::kInvalidArgument, "name must not be empty")
                    .with_error_name("org.example.Error.EmptyName");
        }
        return "hello " + name;
    }

    std::tuple<int32_t, int32_t> divmod(int32_t a, int32_t b) { return {a / b, a % b}; }

    void reset() {
        total_ = 0;
        n_resets++;
    }

    void slow(const dbind::ValueList& args, dbind::MethodReply on_reply) {
        slow_args = args;
        slow_reply = on_reply;
    }

    void finish_slow(dbind::Value result) {
        auto on_reply = slow_reply;
        slow_reply = {};
        on_reply.invoke(dbind::RichStatus::success(), std::move(result));
    }

    void explode(const dbind::ValueList&, dbind::MethodReply) {
        throw std::runtime_error("boom");
    }

    void reply_then_explode(const dbind::ValueList&, dbind::MethodReply on_reply) {
        on_reply.invoke(dbind::RichStatus::success(), dbind::Value{"early"});
        throw std::runtime_error("late boom");
    }

    int32_t total() const { return total_; }

    dbind::RichStatus set_total(int32_t total) {
        if (total < 0) {
            return D_MAKE_ERR_CODE(dbind::Status::kInvalidArgument, "total must not be negative");
        }
        total_ = total;
        return dbind::RichStatus::success();
    }

    std::string version() const { return "1.0"; }

    dbind::ValueList slow_args;
    dbind::MethodReply slow_reply;
    size_t n_resets = 0;

private:
    int32_t total_ = 0;
};

inline dbind::InterfaceTablePtr Counter::table() {
    using namespace dbind;
    static RichStatusOr<InterfaceTablePtr> table = InterfaceBuilder{"org.example.Counter"}
        .inherit(common_interfaces())
        .method("add", {"ii", "i", {"a", "b"}, {"sum"}, {Value{(int32_t)1}}}, method_impl<&Counter::add>())
        .method("greet", {"s", "s", {"name"}, {"greeting"}}, method_impl<&Counter::greet>())
        .method("divmod", {"ii", "ii", {"a", "b"}, {"quotient", "remainder"}}, method_impl<&Counter::divmod>())
        .method("reset", {"", "", {}, {}, {}, "", kNoReply}, method_impl<&Counter::reset>())
        .method("slow", {"s", "s", {"input"}, {"output"}}, async_method_impl<&Counter::slow>())
        .method("explode", {"", "", {}, {}}, async_method_impl<&Counter::explode>())
        .method("reply_then_explode", {"", "s", {}, {}}, async_method_impl<&Counter::reply_then_explode>())
        .property("total", {"i"}, property_getter<&Counter::total>(), property_setter<&Counter::set_total>())
        .property("version", {"s", "", kPropertyConst}, property_getter<&Counter::version>())
        .signal("changed", {"i", {"total"}})
        .plain("finish_slow")
        .build();
    if (!table.has_value()) {
        std::cerr << "Counter declaration failed: " << table.status() << std::endl;
        return nullptr;
    }
    return table.value();
}

#endif // __DBIND_TEST_OBJECTS_HPP
