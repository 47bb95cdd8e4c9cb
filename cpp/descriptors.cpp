#include <dbind/descriptors.hpp>
#include <dbind/name_utils.hpp>

using namespace dbind;

MemberDescriptor::MemberDescriptor(MemberKind kind, std::string key, std::string name,
                                   std::string interface_name, bool serving_enabled, uint32_t flags)
    : kind_(kind), key_(std::move(key)), name_(std::move(name)),
      interface_name_(std::move(interface_name)), serving_enabled_(serving_enabled), flags_(flags)
{
    if (name_.empty()) {
        name_ = to_wire_name(key_);
    }
}

MethodDescriptor::MethodDescriptor(std::string key, MethodInfo info, MethodImpl impl,
                                   std::string interface_name, bool serving_enabled)
    : MemberDescriptor(MemberKind::kMethod, std::move(key), info.name, std::move(interface_name), serving_enabled, info.flags),
      info_(std::move(info)), impl_(impl) {}

RichStatus MethodDescriptor::resolve_args(const ValueList& args, const KeywordArgs& kwargs, ValueList* resolved) const {
    if (args.size() == n_args() && kwargs.empty() &&
            std::none_of(args.begin(), args.end(), [](const Value& arg) { return arg.is_null(); })) {
        *resolved = args;
        return RichStatus::success();
    }

    D_RET_IF_CODE(args.size() > n_args(), Status::kArgumentError,
            key() << "() takes " << n_args() << " arguments but " << args.size() << " were given");

    for (auto& kw: kwargs) {
        D_RET_IF_CODE(std::find(arg_names().begin(), arg_names().end(), kw.first) == arg_names().end(),
                Status::kArgumentError, key() << "() got an unexpected keyword argument '" << kw.first << "'");
    }

    size_t defaults_start = default_args_start_at();
    ValueList result;
    result.reserve(n_args());

    for (size_t i = 0; i < n_args(); ++i) {
        auto kw = kwargs.find(arg_names()[i]);
        if (i < args.size() && !args[i].is_null()) {
            result.push_back(args[i]);
        } else if (kw != kwargs.end()) {
            result.push_back(kw->second);
        } else if (i >= defaults_start && !info_.defaults[i - defaults_start].is_null()) {
            // A null default marks an argument without a usable default
            result.push_back(info_.defaults[i - defaults_start]);
        } else {
            return D_MAKE_ERR_CODE(Status::kArgumentError,
                    key() << "() missing argument '" << arg_names()[i] << "'");
        }
    }

    *resolved = std::move(result);
    return RichStatus::success();
}

std::shared_ptr<const MethodDescriptor> MethodDescriptor::with_impl(MethodImpl impl) const {
    MethodInfo info = info_;
    info.name = name();
    return std::make_shared<const MethodDescriptor>(key(), std::move(info), impl, interface_name(), serving_enabled());
}

RichStatus MethodDescriptor::validate() const {
    D_RET_IF_CODE(!impl_, Status::kDeclarationError, "method " << key() << " has no implementation");
    D_RET_IF_CODE(!is_valid_member_name(name()), Status::kDeclarationError,
            "Invalid method name \"" << name() << "\"");
    D_RET_IF_CODE(!is_valid_signature(input_signature()), Status::kDeclarationError,
            "Invalid input signature \"" << input_signature() << "\" of method " << name());
    D_RET_IF_CODE(!is_valid_signature(result_signature()), Status::kDeclarationError,
            "Invalid result signature \"" << result_signature() << "\" of method " << name());

    size_t n_inputs = count_complete_types(input_signature());
    D_RET_IF_CODE(n_inputs != n_args(), Status::kDeclarationError,
            "method " << name() << " has " << n_args() << " argument names but its input signature \""
            << input_signature() << "\" describes " << n_inputs << " arguments");
    D_RET_IF_CODE(defaults().size() > n_args(), Status::kDeclarationError,
            "method " << name() << " has more defaults than arguments");

    size_t n_outputs = count_complete_types(result_signature());
    D_RET_IF_CODE(result_arg_names().size() > n_outputs, Status::kDeclarationError,
            "method " << name() << " has more result names than results");

    return RichStatus::success();
}

PropertyDescriptor::PropertyDescriptor(std::string key, PropertyInfo info, PropertyGetter getter, PropertySetter setter,
                                       std::string interface_name, bool serving_enabled)
    : MemberDescriptor(MemberKind::kProperty, std::move(key), info.name, std::move(interface_name), serving_enabled, info.flags),
      info_(std::move(info)), getter_(getter), setter_(setter) {}

RichStatus PropertyDescriptor::validate() const {
    D_RET_IF_CODE(!getter_, Status::kDeclarationError, "property " << key() << " has no getter");
    D_RET_IF_CODE(!is_valid_member_name(name()), Status::kDeclarationError,
            "Invalid property name \"" << name() << "\"");
    D_RET_IF_CODE(!is_single_complete_type(signature()), Status::kDeclarationError,
            "property " << name() << " must have a single complete type but has \"" << signature() << "\"");
    return RichStatus::success();
}

SignalDescriptor::SignalDescriptor(std::string key, SignalInfo info, std::string interface_name, bool serving_enabled)
    : MemberDescriptor(MemberKind::kSignal, std::move(key), info.name, std::move(interface_name), serving_enabled, info.flags),
      info_(std::move(info)) {}

RichStatus SignalDescriptor::validate() const {
    D_RET_IF_CODE(!is_valid_member_name(name()), Status::kDeclarationError,
            "Invalid signal name \"" << name() << "\"");
    D_RET_IF_CODE(!is_valid_signature(signature()), Status::kDeclarationError,
            "Invalid signature \"" << signature() << "\" of signal " << name());
    D_RET_IF_CODE(arg_names().size() > count_complete_types(signature()), Status::kDeclarationError,
            "signal " << name() << " has more argument names than arguments");
    return RichStatus::success();
}

std::ostream& dbind::operator<<(std::ostream& stream, MemberKind kind) {
    switch (kind) {
        case MemberKind::kMethod: return stream << "method";
        case MemberKind::kProperty: return stream << "property";
        case MemberKind::kSignal: return stream << "signal";
    }
    return stream << "unknown";
}
