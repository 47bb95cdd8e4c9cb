#include <dbind/interface.hpp>
#include <dbind/name_utils.hpp>

#include <unordered_set>

using namespace dbind;

const MemberDescriptor* InterfaceTable::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : members_[it->second].get();
}

const MethodDescriptor* InterfaceTable::find_method(const std::string& key) const {
    const MemberDescriptor* member = find(key);
    return member && member->kind() == MemberKind::kMethod ? static_cast<const MethodDescriptor*>(member) : nullptr;
}

const PropertyDescriptor* InterfaceTable::find_property(const std::string& key) const {
    const MemberDescriptor* member = find(key);
    return member && member->kind() == MemberKind::kProperty ? static_cast<const PropertyDescriptor*>(member) : nullptr;
}

const SignalDescriptor* InterfaceTable::find_signal(const std::string& key) const {
    const MemberDescriptor* member = find(key);
    return member && member->kind() == MemberKind::kSignal ? static_cast<const SignalDescriptor*>(member) : nullptr;
}

std::vector<std::string> InterfaceTable::interface_names() const {
    std::vector<std::string> result;
    for (auto& member: members_) {
        const std::string& name = member->interface_name();
        if (!name.empty() && std::find(result.begin(), result.end(), name) == result.end()) {
            result.push_back(name);
        }
    }
    return result;
}

InterfaceBuilder::InterfaceBuilder(std::string interface_name, bool serving_enabled)
    : interface_name_(std::move(interface_name)), serving_enabled_(serving_enabled) {}

InterfaceBuilder& InterfaceBuilder::inherit(InterfaceTablePtr base) {
    if (base) {
        bases_.push_back(std::move(base));
    } else {
        has_null_base_ = true;
    }
    return *this;
}

InterfaceBuilder& InterfaceBuilder::method(std::string key, MethodInfo info, MethodImpl impl) {
    auto descriptor = std::make_shared<const MethodDescriptor>(key, std::move(info), impl, interface_name_, serving_enabled_);
    entries_.push_back({EntryKind::kDescriptor, std::move(key), std::move(descriptor), nullptr});
    return *this;
}

InterfaceBuilder& InterfaceBuilder::property(std::string key, PropertyInfo info, PropertyGetter getter, PropertySetter setter) {
    auto descriptor = std::make_shared<const PropertyDescriptor>(key, std::move(info), getter, setter, interface_name_, serving_enabled_);
    entries_.push_back({EntryKind::kDescriptor, std::move(key), std::move(descriptor), nullptr});
    return *this;
}

InterfaceBuilder& InterfaceBuilder::signal(std::string key, SignalInfo info) {
    auto descriptor = std::make_shared<const SignalDescriptor>(key, std::move(info), interface_name_, serving_enabled_);
    entries_.push_back({EntryKind::kDescriptor, std::move(key), std::move(descriptor), nullptr});
    return *this;
}

InterfaceBuilder& InterfaceBuilder::plain(std::string key) {
    entries_.push_back({EntryKind::kPlain, std::move(key), nullptr, nullptr});
    return *this;
}

InterfaceBuilder& InterfaceBuilder::override_method(std::string key, MethodImpl impl) {
    entries_.push_back({EntryKind::kOverride, std::move(key), nullptr, impl});
    return *this;
}

static RichStatus declaration_error(RichStatus status) {
    return status.with_code(Status::kDeclarationError);
}

RichStatusOr<InterfaceTablePtr> InterfaceBuilder::build() const {
    D_RET_IF_CODE(!interface_name_.empty() && !is_valid_interface_name(interface_name_),
            Status::kDeclarationError, "Invalid interface name \"" << interface_name_ << "\"");
    D_RET_IF_CODE(has_null_base_, Status::kDeclarationError,
            "base table of " << interface_name_ << " is missing (did its declaration fail?)");

    auto table = std::make_shared<InterfaceTable>();
    table->interface_name_ = interface_name_;
    table->serving_enabled_ = serving_enabled_;

    for (auto& base: bases_) {
        for (auto& member: base->members_) {
            if (table->index_.count(member->key()) || table->plain_keys_.count(member->key())) {
                continue; // first base wins
            }
            table->index_[member->key()] = table->members_.size();
            table->members_.push_back(member);
        }
        for (auto& key: base->plain_keys_) {
            if (!table->index_.count(key)) {
                table->plain_keys_.insert(key);
            }
        }
    }

    std::unordered_set<std::string> declared_keys;

    for (auto& entry: entries_) {
        D_RET_IF_CODE(!declared_keys.insert(entry.key).second, Status::kDeclarationError,
                "member " << entry.key << " declared more than once");

        auto it = table->index_.find(entry.key);
        bool inherited = it != table->index_.end();
        bool inherited_plain = table->plain_keys_.count(entry.key) > 0;

        switch (entry.kind) {
            case EntryKind::kOverride: {
                D_RET_IF_CODE(inherited_plain, Status::kDeclarationError,
                        "override of " << entry.key << " but a base declares it as a plain member");
                D_RET_IF_CODE(!inherited, Status::kDeclarationError,
                        "override of " << entry.key << " but no base declares it");
                const MemberDescriptor* base_member = table->members_[it->second].get();
                D_RET_IF_CODE(base_member->kind() != MemberKind::kMethod, Status::kDeclarationError,
                        "cannot override " << base_member->kind() << " " << entry.key << ", only methods can be overridden");
                D_RET_IF_CODE(!entry.override_impl, Status::kDeclarationError,
                        "override of " << entry.key << " has no implementation");
                table->members_[it->second] =
                        static_cast<const MethodDescriptor*>(base_member)->with_impl(entry.override_impl);
            } break;

            case EntryKind::kPlain: {
                D_RET_IF_CODE(inherited, Status::kDeclarationError,
                        "plain member " << entry.key << " shadows an inherited D-Bus member");
                table->plain_keys_.insert(entry.key);
            } break;

            case EntryKind::kDescriptor: {
                D_RET_IF_CODE(inherited, Status::kDeclarationError,
                        "member " << entry.key << " redeclares an inherited D-Bus member, use override_method()");
                D_RET_IF_CODE(inherited_plain, Status::kDeclarationError,
                        "member " << entry.key << " redeclares a plain member of a base");
                RichStatus status = entry.descriptor->validate();
                if (status.is_error()) {
                    return declaration_error(D_AMEND_ERR(status, "in interface \"" << interface_name_ << "\""));
                }
                table->index_[entry.key] = table->members_.size();
                table->members_.push_back(entry.descriptor);
            } break;
        }
    }

    // Two members of the same kind must not share a wire name within one
    // interface, otherwise the bus could not tell them apart.
    std::unordered_set<std::string> wire_names;
    for (auto& member: table->members_) {
        if (member->interface_name().empty()) {
            continue;
        }
        std::string wire_key = member->interface_name() + "/" + std::to_string((int)member->kind()) + "/" + member->name();
        D_RET_IF_CODE(!wire_names.insert(wire_key).second, Status::kDeclarationError,
                member->kind() << " " << member->interface_name() << "." << member->name() << " is declared twice");
    }

    return InterfaceTablePtr{table};
}
