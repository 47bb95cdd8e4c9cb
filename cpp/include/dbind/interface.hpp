#ifndef __DBIND_INTERFACE_HPP
#define __DBIND_INTERFACE_HPP

#include <dbind/descriptors.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dbind {

/**
 * @brief Immutable member table of an interface type.
 *
 * Contains the members declared by the type itself as well as all inherited
 * members, in declaration order (inherited members first).
 */
class InterfaceTable {
public:
    /** @brief Interface name the type's own members were declared with. */
    const std::string& interface_name() const { return interface_name_; }
    bool serving_enabled() const { return serving_enabled_; }

    const MemberDescriptor* find(const std::string& key) const;
    const MethodDescriptor* find_method(const std::string& key) const;
    const PropertyDescriptor* find_property(const std::string& key) const;
    const SignalDescriptor* find_signal(const std::string& key) const;
    bool contains(const std::string& key) const { return index_.count(key) > 0; }

    const std::vector<std::shared_ptr<const MemberDescriptor>>& members() const { return members_; }

    /**
     * @brief Returns the distinct non-empty interface names of all members in
     * order of first appearance.
     */
    std::vector<std::string> interface_names() const;

private:
    friend class InterfaceBuilder;

    std::string interface_name_;
    bool serving_enabled_ = true;
    std::vector<std::shared_ptr<const MemberDescriptor>> members_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_set<std::string> plain_keys_; // shadow inherited keys in derived tables
};

using InterfaceTablePtr = std::shared_ptr<const InterfaceTable>;

/**
 * @brief Declares the members of an interface type and checks the
 * declaration.
 *
 * Typical use, once per type:
 *
 *     static RichStatusOr<InterfaceTablePtr> table = InterfaceBuilder{"org.example.Calculator"}
 *         .inherit(common_interfaces())
 *         .method("multiply", {"xx", "x", {"a", "b"}, {"product"}}, method_impl<&Calculator::multiply>())
 *         .property("total", {"x"}, property_getter<&Calculator::total>())
 *         .signal("overflowed", {"x", {"value"}})
 *         .build();
 *
 * All errors are reported by build() with Status::kDeclarationError.
 */
class InterfaceBuilder {
public:
    explicit InterfaceBuilder(std::string interface_name = "", bool serving_enabled = true);

    /**
     * @brief Adds a base table. If several bases contain the same key, the
     * one added first wins.
     */
    InterfaceBuilder& inherit(InterfaceTablePtr base);

    InterfaceBuilder& method(std::string key, MethodInfo info, MethodImpl impl);
    InterfaceBuilder& property(std::string key, PropertyInfo info, PropertyGetter getter, PropertySetter setter = nullptr);
    InterfaceBuilder& signal(std::string key, SignalInfo info);

    /**
     * @brief Declares a member that exists only locally (not on the bus).
     *
     * Used to detect plain members that would shadow inherited bus members.
     */
    InterfaceBuilder& plain(std::string key);

    /**
     * @brief Replaces the implementation of an inherited method while keeping
     * its bus-facing definition.
     */
    InterfaceBuilder& override_method(std::string key, MethodImpl impl);

    RichStatusOr<InterfaceTablePtr> build() const;

private:
    enum class EntryKind {
        kDescriptor,
        kPlain,
        kOverride,
    };

    struct Entry {
        EntryKind kind;
        std::string key;
        std::shared_ptr<const MemberDescriptor> descriptor;
        MethodImpl override_impl;
    };

    std::string interface_name_;
    bool serving_enabled_;
    std::vector<InterfaceTablePtr> bases_;
    bool has_null_base_ = false;
    std::vector<Entry> entries_;
};

}

#endif // __DBIND_INTERFACE_HPP
