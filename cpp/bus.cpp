#include <dbind/bus.hpp>

#include <algorithm>

using namespace dbind;

SignalQueue::~SignalQueue() {
    on_close_.invoke(this);
}

RichStatus SignalQueue::next(Callback<void, Value> on_value) {
    D_RET_IF_CODE(on_value_.has_value(), Status::kInvalidState, "another reader is already waiting");
    D_RET_IF_CODE(!on_value.has_value(), Status::kInvalidArgument, "callback must not be empty");

    if (!backlog_.empty()) {
        Value value = std::move(backlog_.front());
        backlog_.pop_front();
        on_value.invoke(std::move(value));
    } else {
        on_value_ = on_value;
    }
    return RichStatus::success();
}

void SignalQueue::cancel_next() {
    on_value_ = {};
}

void SignalQueue::push(Value value) {
    if (on_value_.has_value()) {
        // Reset before invoking so that the callback can call next() again.
        auto on_value = on_value_;
        on_value_ = {};
        on_value.invoke(std::move(value));
    } else {
        backlog_.push_back(std::move(value));
    }
}

const ServerMethod* ServerInterface::find_method(const std::string& member) const {
    for (auto& method: methods) {
        if (method.descriptor->name() == member) {
            return &method;
        }
    }
    return nullptr;
}

const ServerProperty* ServerInterface::find_property(const std::string& member) const {
    for (auto& property: properties) {
        if (property.descriptor->name() == member) {
            return &property;
        }
    }
    return nullptr;
}

std::vector<ServerInterface> dbind::describe_table(const InterfaceTable& table, bool include_unservable) {
    std::vector<ServerInterface> result;

    for (auto& member: table.members()) {
        if (member->interface_name().empty()) {
            continue;
        }
        if (!member->serving_enabled() && !include_unservable) {
            continue;
        }

        auto it = std::find_if(result.begin(), result.end(), [&](const ServerInterface& intf) {
            return intf.name == member->interface_name();
        });
        if (it == result.end()) {
            result.push_back(ServerInterface{member->interface_name(), {}, {}, {}});
            it = result.end() - 1;
        }

        switch (member->kind()) {
            case MemberKind::kMethod:
                it->methods.push_back({static_cast<const MethodDescriptor*>(member.get()), {}});
                break;
            case MemberKind::kProperty:
                it->properties.push_back({static_cast<const PropertyDescriptor*>(member.get()), {}, {}});
                break;
            case MemberKind::kSignal:
                it->signals.push_back(static_cast<const SignalDescriptor*>(member.get()));
                break;
        }
    }

    return result;
}
