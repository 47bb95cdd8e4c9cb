#include <dbind/interface.hpp>
#include "test_utils.hpp"

using namespace dbind;

static void noop(Object*, const ValueList&, MethodReply on_reply) {
    on_reply.invoke(RichStatus::success(), Value{});
}

static void other_noop(Object*, const ValueList&, MethodReply on_reply) {
    on_reply.invoke(RichStatus::success(), Value{"other"});
}

static RichStatus get_zero(Object*, Value* value) {
    *value = Value{(int32_t)0};
    return RichStatus::success();
}

static RichStatus set_ignore(Object*, const Value&) {
    return RichStatus::success();
}

static InterfaceTablePtr build_base() {
    RichStatusOr<InterfaceTablePtr> table = InterfaceBuilder{"org.example.Base"}
        .method("do_work", {"si", "b", {"what", "how_often"}, {"ok"}}, &noop)
        .property("level", {"i"}, &get_zero, &set_ignore)
        .signal("work_done", {"s", {"what"}})
        .build();
    return table.has_value() ? table.value() : nullptr;
}

TestContext basic_test() {
    TestContext context;

    InterfaceTablePtr base = build_base();
    if (!TEST_NOT_NULL(base.get())) {
        return context;
    }

    TEST_EQUAL(base->interface_name(), std::string{"org.example.Base"});
    TEST_EQUAL(base->members().size(), (size_t)3);

    const MethodDescriptor* method = base->find_method("do_work");
    if (TEST_NOT_NULL(method)) {
        TEST_EQUAL(method->name(), std::string{"DoWork"});
        TEST_EQUAL(method->interface_name(), std::string{"org.example.Base"});
        TEST_EQUAL(method->n_args(), (size_t)2);
        TEST_ASSERT(method->serving_enabled());
    }

    const PropertyDescriptor* property = base->find_property("level");
    if (TEST_NOT_NULL(property)) {
        TEST_EQUAL(property->name(), std::string{"Level"});
        TEST_ASSERT(property->is_writable());
    }

    TEST_NOT_NULL(base->find_signal("work_done"));

    // Lookups of the wrong kind find nothing
    TEST_ASSERT(base->find_property("do_work") == nullptr);
    TEST_ASSERT(base->find_method("work_done") == nullptr);
    TEST_ASSERT(base->find("missing") == nullptr);

    return context;
}

TestContext inheritance_test() {
    TestContext context;

    InterfaceTablePtr base = build_base();
    if (!TEST_NOT_NULL(base.get())) {
        return context;
    }

    RichStatusOr<InterfaceTablePtr> derived = InterfaceBuilder{"org.example.Derived"}
        .inherit(base)
        .method("extra", {"", "", {}, {}}, &noop)
        .override_method("do_work", &other_noop)
        .plain("helper")
        .build();
    if (!TEST_OK(derived.status())) {
        return context;
    }

    const InterfaceTable& table = *derived.value();
    TEST_EQUAL(table.members().size(), (size_t)4);
    TEST_ASSERT(!table.contains("helper"));

    // The override keeps the inherited definition but swaps the implementation
    const MethodDescriptor* overridden = table.find_method("do_work");
    if (TEST_NOT_NULL(overridden)) {
        TEST_EQUAL(overridden->interface_name(), std::string{"org.example.Base"});
        TEST_EQUAL(overridden->name(), std::string{"DoWork"});
        TEST_EQUAL(overridden->input_signature(), std::string{"si"});
        TEST_ASSERT(overridden->impl() == &other_noop);
    }
    TEST_ASSERT(base->find_method("do_work")->impl() == &noop);

    std::vector<std::string> names = table.interface_names();
    if (TEST_EQUAL(names.size(), (size_t)2)) {
        TEST_EQUAL(names[0], std::string{"org.example.Base"});
        TEST_EQUAL(names[1], std::string{"org.example.Derived"});
    }

    return context;
}

TestContext first_base_wins_test() {
    TestContext context;

    RichStatusOr<InterfaceTablePtr> a = InterfaceBuilder{"org.example.A"}
        .method("run", {"", "", {}, {}}, &noop).build();
    RichStatusOr<InterfaceTablePtr> b = InterfaceBuilder{"org.example.B"}
        .method("run", {"", "", {}, {}}, &other_noop).build();
    if (!TEST_OK(a.status()) || !TEST_OK(b.status())) {
        return context;
    }

    RichStatusOr<InterfaceTablePtr> both = InterfaceBuilder{}.inherit(a.value()).inherit(b.value()).build();
    if (TEST_OK(both.status())) {
        const MethodDescriptor* run = both.value()->find_method("run");
        if (TEST_NOT_NULL(run)) {
            TEST_EQUAL(run->interface_name(), std::string{"org.example.A"});
        }
    }

    return context;
}

TestContext declaration_error_test() {
    TestContext context;
    InterfaceTablePtr base = build_base();

    TEST_CODE(InterfaceBuilder{"0.test"}.build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org"}.build().status(), Status::kDeclarationError);

    // Wire names must follow the member name grammar
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("\xf0\x9f\xa4\xab", {"", "", {}, {}}, &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("ok", {"", "", {}, {}, {}, "Not.Ok"}, &noop).build().status(), Status::kDeclarationError);

    // Argument names and signature must agree
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("add", {"ii", "i", {"a"}, {}}, &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("add", {"ii", "i", {"a", "b"}, {"sum", "carry"}}, &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("add", {"ii", "i", {"a", "b"}, {}, {Value{(int32_t)1}, Value{(int32_t)2}, Value{(int32_t)3}}}, &noop)
        .build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("add", {"i(", "", {"a"}, {}}, &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("add", {"", "", {}, {}}, nullptr).build().status(), Status::kDeclarationError);

    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .property("pair", {"ii"}, &get_zero).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .property("pair", {"i"}, nullptr).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .signal("changed", {"s", {"a", "b"}}).build().status(), Status::kDeclarationError);

    // Override rules
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .method("do_work", {"si", "b", {"what", "how_often"}, {"ok"}}, &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .override_method("not_inherited", &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .override_method("level", &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .override_method("do_work", nullptr).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .plain("work_done").build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .plain("do_work").build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .plain("level").build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .property("level", {"i"}, &get_zero).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(base)
        .signal("work_done", {"s", {"what"}}).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}.inherit(nullptr).build().status(), Status::kDeclarationError);

    // Duplicates
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("run", {"", "", {}, {}}, &noop)
        .signal("run", {""}).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Test"}
        .method("get_x", {"", "", {}, {}}, &noop)
        .method("GetX", {"", "", {}, {}}, &noop).build().status(), Status::kDeclarationError);

    // Same wire name for different kinds is fine
    TEST_OK(InterfaceBuilder{"org.example.Test"}
        .method("value", {"", "", {}, {}}, &noop)
        .signal("value_", {""}).build().status());

    return context;
}

TestContext plain_shadowing_test() {
    TestContext context;

    RichStatusOr<InterfaceTablePtr> child = InterfaceBuilder{"org.example.Child"}
        .inherit(build_base())
        .plain("helper")
        .build();
    if (!TEST_OK(child.status())) {
        return context;
    }
    TEST_ASSERT(child.value()->find("helper") == nullptr);

    // A plain member keeps shadowing its name further down the hierarchy
    TEST_CODE(InterfaceBuilder{"org.example.Grandchild"}.inherit(child.value())
        .method("helper", {"", "", {}, {}}, &noop).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Grandchild"}.inherit(child.value())
        .property("helper", {"i"}, &get_zero).build().status(), Status::kDeclarationError);
    TEST_CODE(InterfaceBuilder{"org.example.Grandchild"}.inherit(child.value())
        .override_method("helper", &noop).build().status(), Status::kDeclarationError);

    RichStatusOr<InterfaceTablePtr> grandchild = InterfaceBuilder{"org.example.Grandchild"}
        .inherit(child.value())
        .plain("helper")
        .override_method("do_work", &other_noop)
        .build();
    if (TEST_OK(grandchild.status())) {
        TEST_ASSERT(!grandchild.value()->contains("helper"));
        TEST_EQUAL(grandchild.value()->members().size(), (size_t)3);
    }

    return context;
}

TestContext resolve_args_test() {
    TestContext context;

    MethodDescriptor method{"connect", {"sib", "", {"host", "port", "secure"}, {}, {Value{(int32_t)80}, Value{false}}},
                            &noop, "org.example.Test", true};
    TEST_EQUAL(method.default_args_start_at(), (size_t)1);

    ValueList resolved;
    TEST_OK(method.resolve_args({Value{"a"}}, {}, &resolved));
    TEST_ASSERT(resolved == (ValueList{Value{"a"}, Value{(int32_t)80}, Value{false}}));

    TEST_OK(method.resolve_args({Value{"a"}}, {{"secure", Value{true}}}, &resolved));
    TEST_ASSERT(resolved == (ValueList{Value{"a"}, Value{(int32_t)80}, Value{true}}));

    // A null positional leaves the slot to keywords and defaults
    TEST_OK(method.resolve_args({Value{}, Value{(int32_t)22}}, {{"host", Value{"b"}}}, &resolved));
    TEST_ASSERT(resolved == (ValueList{Value{"b"}, Value{(int32_t)22}, Value{false}}));

    // Positionals take precedence over keywords
    TEST_OK(method.resolve_args({Value{"a"}}, {{"host", Value{"b"}}}, &resolved));
    TEST_EQUAL(resolved[0], Value{"a"});

    TEST_CODE(method.resolve_args({}, {}, &resolved), Status::kArgumentError);
    TEST_CODE(method.resolve_args({Value{"a"}}, {{"timeout", Value{(int32_t)1}}}, &resolved), Status::kArgumentError);
    TEST_CODE(method.resolve_args({Value{"a"}, Value{(int32_t)1}, Value{true}, Value{true}}, {}, &resolved), Status::kArgumentError);

    // A null default does not fill its slot
    MethodDescriptor open_file{"open", {"si", "", {"path", "mode"}, {}, {Value{}}}, &noop, "org.example.Test", true};
    TEST_CODE(open_file.resolve_args({Value{"a"}}, {}, &resolved), Status::kArgumentError);
    TEST_CODE(open_file.resolve_args({Value{"a"}, Value{}}, {}, &resolved), Status::kArgumentError);
    TEST_OK(open_file.resolve_args({Value{"a"}}, {{"mode", Value{(int32_t)2}}}, &resolved));
    TEST_ASSERT(resolved == (ValueList{Value{"a"}, Value{(int32_t)2}}));

    return context;
}

int main() {
    TestContext context;

    TEST_ADD(basic_test());
    TEST_ADD(inheritance_test());
    TEST_ADD(first_base_wins_test());
    TEST_ADD(declaration_error_test());
    TEST_ADD(plain_shadowing_test());
    TEST_ADD(resolve_args_test());

    return context.summarize();
}
