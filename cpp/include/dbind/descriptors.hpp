#ifndef __DBIND_DESCRIPTORS_HPP
#define __DBIND_DESCRIPTORS_HPP

#include <dbind/callback.hpp>
#include <dbind/rich_status.hpp>
#include <dbind/value.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dbind {

class Object;

/**
 * @brief Completion callback of a method call.
 *
 * On success the status is success and the value holds the result (null for
 * methods without results, a Struct for methods with several results).
 */
using MethodReply = Callback<void, RichStatus, Value>;

/**
 * @brief Type-erased method implementation.
 *
 * Receives the full positional argument list and must invoke `on_reply`
 * exactly once, either before returning or later from the event loop.
 * See adapters.hpp for wrapping ordinary member functions.
 */
using MethodImpl = void(*)(Object* obj, const ValueList& args, MethodReply on_reply);
using PropertyGetter = RichStatus(*)(Object* obj, Value* value);
using PropertySetter = RichStatus(*)(Object* obj, const Value& value);

using KeywordArgs = std::unordered_map<std::string, Value>;

enum MemberFlags : uint32_t {
    kNoFlags = 0,
    kDeprecated = 1 << 0,
    kNoReply = 1 << 1, //!< Method: the caller does not wait for a reply
    kPropertyConst = 1 << 2, //!< Property: value never changes
    kPropertyEmitsInvalidation = 1 << 3, //!< Property: changes are signalled without the new value
    kPropertyNoEmit = 1 << 4, //!< Property: changes are not signalled
};

enum class MemberKind {
    kMethod,
    kProperty,
    kSignal,
};

struct MethodInfo {
    std::string input_signature;
    std::string result_signature;
    std::vector<std::string> arg_names;
    std::vector<std::string> result_arg_names;
    ValueList defaults; //!< Defaults for the trailing arguments
    std::string name; //!< Wire name. Derived from the key if empty.
    uint32_t flags = kNoFlags;
};

struct PropertyInfo {
    std::string signature;
    std::string name; //!< Wire name. Derived from the key if empty.
    uint32_t flags = kNoFlags;
};

struct SignalInfo {
    std::string signature;
    std::vector<std::string> arg_names;
    std::string name; //!< Wire name. Derived from the key if empty.
    uint32_t flags = kNoFlags;
};

/**
 * @brief Immutable definition of one interface member.
 *
 * Descriptors are created by InterfaceBuilder and shared between all
 * InterfaceTables that contain them.
 */
class MemberDescriptor {
public:
    virtual ~MemberDescriptor() = default;

    MemberKind kind() const { return kind_; }

    /** @brief In-language name under which the member is looked up. */
    const std::string& key() const { return key_; }

    /** @brief Name of the member on the bus. */
    const std::string& name() const { return name_; }

    const std::string& interface_name() const { return interface_name_; }
    bool serving_enabled() const { return serving_enabled_; }
    uint32_t flags() const { return flags_; }

    /**
     * @brief Checks names and signatures against the D-Bus grammar.
     */
    virtual RichStatus validate() const = 0;

protected:
    MemberDescriptor(MemberKind kind, std::string key, std::string name,
                     std::string interface_name, bool serving_enabled, uint32_t flags);

private:
    MemberKind kind_;
    std::string key_;
    std::string name_;
    std::string interface_name_;
    bool serving_enabled_;
    uint32_t flags_;
};

class MethodDescriptor final : public MemberDescriptor {
public:
    MethodDescriptor(std::string key, MethodInfo info, MethodImpl impl,
                     std::string interface_name, bool serving_enabled);

    MethodImpl impl() const { return impl_; }
    const std::string& input_signature() const { return info_.input_signature; }
    const std::string& result_signature() const { return info_.result_signature; }
    const std::vector<std::string>& arg_names() const { return info_.arg_names; }
    const std::vector<std::string>& result_arg_names() const { return info_.result_arg_names; }
    const ValueList& defaults() const { return info_.defaults; }
    size_t n_args() const { return info_.arg_names.size(); }

    /** @brief Index of the first argument that has a default value. */
    size_t default_args_start_at() const { return n_args() - std::min(n_args(), info_.defaults.size()); }

    /**
     * @brief Builds the full positional argument list for a call.
     *
     * If exactly n_args() positionals and no keywords are given they are
     * used as they are. Otherwise each slot takes, in this order of priority,
     * the positional argument (unless null), the keyword argument of the same
     * name or the declared default. Fails with Status::kArgumentError if a
     * slot stays empty, if there are more positionals than parameters or if
     * a keyword names no parameter.
     */
    RichStatus resolve_args(const ValueList& args, const KeywordArgs& kwargs, ValueList* resolved) const;

    /**
     * @brief Returns a copy of this descriptor that uses a different
     * implementation. All other properties are preserved.
     */
    std::shared_ptr<const MethodDescriptor> with_impl(MethodImpl impl) const;

    RichStatus validate() const final;

private:
    MethodInfo info_;
    MethodImpl impl_;
};

class PropertyDescriptor final : public MemberDescriptor {
public:
    PropertyDescriptor(std::string key, PropertyInfo info, PropertyGetter getter, PropertySetter setter,
                       std::string interface_name, bool serving_enabled);

    const std::string& signature() const { return info_.signature; }
    PropertyGetter getter() const { return getter_; }
    PropertySetter setter() const { return setter_; }
    bool is_writable() const { return setter_ != nullptr; }

    RichStatus validate() const final;

private:
    PropertyInfo info_;
    PropertyGetter getter_;
    PropertySetter setter_;
};

class SignalDescriptor final : public MemberDescriptor {
public:
    SignalDescriptor(std::string key, SignalInfo info, std::string interface_name, bool serving_enabled);

    const std::string& signature() const { return info_.signature; }
    const std::vector<std::string>& arg_names() const { return info_.arg_names; }

    RichStatus validate() const final;

private:
    SignalInfo info_;
};

std::ostream& operator<<(std::ostream& stream, MemberKind kind);

}

#endif // __DBIND_DESCRIPTORS_HPP
