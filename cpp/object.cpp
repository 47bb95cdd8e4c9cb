#include <dbind/object.hpp>
#include <dbind/name_utils.hpp>

#include <algorithm>
#include <exception>

using namespace dbind;

static const char* kPropertiesInterface = "org.freedesktop.DBus.Properties";

/* BoundMethod ---------------------------------------------------------------*/

void BoundMethod::call(const ValueList& args, MethodReply on_done) const {
    call(args, KeywordArgs{}, on_done);
}

void BoundMethod::call(const ValueList& args, const KeywordArgs& kwargs, MethodReply on_done) const {
    if (!descriptor_) {
        on_done.invoke(D_MAKE_ERR_CODE(Status::kInvalidArgument, "no such method"), Value{});
        return;
    }

    ValueList resolved;
    RichStatus status = descriptor_->resolve_args(args, kwargs, &resolved);
    if (status.is_error()) {
        on_done.invoke(status, Value{});
        return;
    }

    if (obj_->is_proxy()) {
        call_remote(std::move(resolved), on_done);
    } else {
        descriptor_->impl()(obj_, resolved, on_done);
    }
}

struct PendingMethodCall {
    MethodReply on_done;

    void on_reply(RichStatus status, ValueList args) {
        MethodReply on_done_copy = on_done;
        delete this;
        if (status.is_error()) {
            on_done_copy.invoke(status, Value{});
        } else {
            on_done_copy.invoke(status, payload_to_value(std::move(args)));
        }
    }
};

void BoundMethod::call_remote(ValueList args, MethodReply on_done) const {
    MethodCall call{
        obj_->remote_name(), obj_->object_path(),
        descriptor_->interface_name(), descriptor_->name(),
        descriptor_->input_signature(), std::move(args),
        (descriptor_->flags() & kNoReply) != 0
    };

    PendingMethodCall* ctx = new PendingMethodCall{on_done};
    RichStatus status = obj_->bus()->call_async(call, MEMBER_CB(ctx, on_reply));
    if (status.is_error()) {
        delete ctx;
        on_done.invoke(D_AMEND_ERR(status, "failed to call " << descriptor_->interface_name() << "." << descriptor_->name()), Value{});
    }
}

/**
 * @brief Makes sure that a dispatched call is answered exactly once, also if
 * the implementation throws.
 */
struct DispatchContext {
    MethodReply on_reply;
    bool in_call = true;
    bool replied = false;

    void handle_reply(RichStatus status, Value value) {
        if (replied) {
            return;
        }
        replied = true;
        on_reply.invoke(status, std::move(value));
        if (!in_call) {
            delete this;
        }
    }
};

void BoundMethod::dispatch(const ValueList& args, MethodReply on_reply) const {
    if (!descriptor_) {
        on_reply.invoke(D_MAKE_ERR_CODE(Status::kInvalidArgument, "no such method"), Value{});
        return;
    }

    DispatchContext* ctx = new DispatchContext{on_reply};

    try {
        descriptor_->impl()(obj_, args, MEMBER_CB(ctx, handle_reply));
    } catch (const std::exception& ex) {
        D_LOG_W(obj_->logger(), descriptor_->name() << " threw an exception: " << ex.what());
        ctx->handle_reply(D_MAKE_ERR("exception in " << descriptor_->name() << ": " << ex.what()), Value{});
    } catch (...) {
        D_LOG_W(obj_->logger(), descriptor_->name() << " threw an unknown exception");
        ctx->handle_reply(D_MAKE_ERR("unknown exception in " << descriptor_->name()), Value{});
    }

    ctx->in_call = false;
    if (ctx->replied) {
        delete ctx;
    }
}

/* BoundProperty -------------------------------------------------------------*/

RichStatus BoundProperty::get_sync(Value* value) const {
    D_RET_IF_CODE(!descriptor_, Status::kInvalidArgument, "no such property");
    D_RET_IF_ERR(descriptor_->getter()(obj_, value), "getter of " << descriptor_->name() << " failed");
    return RichStatus::success();
}

RichStatus BoundProperty::set_sync(const Value& value) const {
    D_RET_IF_CODE(!descriptor_, Status::kInvalidArgument, "no such property");
    D_RET_IF_CODE(!descriptor_->setter(), Status::kNoSetter,
            "property " << descriptor_->name() << " is read-only");
    D_RET_IF_ERR(descriptor_->setter()(obj_, value), "setter of " << descriptor_->name() << " failed");
    return RichStatus::success();
}

struct PendingPropertyGet {
    Callback<void, RichStatus, Value> on_done;

    void on_reply(RichStatus status, ValueList args) {
        auto on_done_copy = on_done;
        delete this;

        if (status.is_error()) {
            on_done_copy.invoke(status, Value{});
            return;
        }

        const Variant* var = args.size() == 1 ? args[0].get_if<Variant>() : nullptr;
        if (!var || !var->inner) {
            on_done_copy.invoke(D_MAKE_ERR_CODE(Status::kInvalidArgument, "Properties.Get returned " << args), Value{});
            return;
        }
        on_done_copy.invoke(RichStatus::success(), *var->inner);
    }
};

struct PendingPropertySet {
    Callback<void, RichStatus> on_done;

    void on_reply(RichStatus status, ValueList) {
        auto on_done_copy = on_done;
        delete this;
        on_done_copy.invoke(status);
    }
};

void BoundProperty::get_async(Callback<void, RichStatus, Value> on_done) const {
    if (!descriptor_ || !obj_->is_proxy()) {
        Value value;
        RichStatus status = get_sync(&value);
        on_done.invoke(status, std::move(value));
        return;
    }

    MethodCall call{
        obj_->remote_name(), obj_->object_path(), kPropertiesInterface, "Get", "ss",
        {Value{descriptor_->interface_name()}, Value{descriptor_->name()}}
    };

    PendingPropertyGet* ctx = new PendingPropertyGet{on_done};
    RichStatus status = obj_->bus()->call_async(call, MEMBER_CB(ctx, on_reply));
    if (status.is_error()) {
        delete ctx;
        on_done.invoke(D_AMEND_ERR(status, "failed to get property " << descriptor_->name()), Value{});
    }
}

void BoundProperty::set_async(const Value& value, Callback<void, RichStatus> on_done) const {
    if (!descriptor_ || !obj_->is_proxy()) {
        on_done.invoke(set_sync(value));
        return;
    }

    MethodCall call{
        obj_->remote_name(), obj_->object_path(), kPropertiesInterface, "Set", "ssv",
        {Value{descriptor_->interface_name()}, Value{descriptor_->name()},
         Value{Variant{descriptor_->signature(), value}}}
    };

    PendingPropertySet* ctx = new PendingPropertySet{on_done};
    RichStatus status = obj_->bus()->call_async(call, MEMBER_CB(ctx, on_reply));
    if (status.is_error()) {
        delete ctx;
        on_done.invoke(D_AMEND_ERR(status, "failed to set property " << descriptor_->name()));
    }
}

/* BoundSignal ---------------------------------------------------------------*/

RichStatus BoundSignal::subscribe(std::unique_ptr<SignalQueue>* p_queue) const {
    D_RET_IF_CODE(!descriptor_, Status::kInvalidArgument, "no such signal");
    D_RET_IF_CODE(!p_queue, Status::kInvalidArgument, "p_queue must not be null");

    if (obj_->is_proxy()) {
        SignalMatch match{obj_->remote_name(), obj_->object_path(), descriptor_->interface_name(), descriptor_->name()};
        D_RET_IF_ERR(obj_->bus()->open_signal_queue(match, p_queue),
                "failed to subscribe to " << descriptor_->interface_name() << "." << descriptor_->name());
        return RichStatus::success();
    }

    auto queue = std::make_unique<SignalQueue>(MEMBER_CB(obj_, handle_local_queue_closed));
    obj_->local_signal_queues_[descriptor_].push_back(queue.get());
    *p_queue = std::move(queue);
    return RichStatus::success();
}

RichStatus BoundSignal::emit(const Value& value) const {
    D_RET_IF_CODE(!descriptor_, Status::kInvalidArgument, "no such signal");

    RichStatus status;

    // Also sent for interfaces that are not registered themselves
    if (obj_->served_interfaces_.size() && !descriptor_->interface_name().empty()) {
        SignalEmission emission{
            obj_->object_path(), descriptor_->interface_name(), descriptor_->name(),
            descriptor_->signature(), value_to_payload(value, descriptor_->signature())
        };
        status = obj_->bus()->emit_signal(emission);
        if (status.is_error()) {
            status = D_AMEND_ERR(status, "failed to emit " << descriptor_->interface_name() << "." << descriptor_->name());
        }
    }

    obj_->push_to_local_queues(descriptor_, value);
    return status;
}

/* Object --------------------------------------------------------------------*/

static InterfaceTablePtr empty_table() {
    static InterfaceTablePtr table = std::make_shared<InterfaceTable>();
    return table;
}

Object::Object(InterfaceTablePtr table)
    : table_(table ? std::move(table) : empty_table()) {}

Object::~Object() {
    stop_serving();

    for (auto& it: local_signal_queues_) {
        for (SignalQueue* queue: it.second) {
            queue->detach();
        }
    }
}

const Logger& Object::logger() const {
    static const Logger none = Logger::none();
    return bus_ ? bus_->logger() : none;
}

RichStatus Object::connect(Bus* bus, std::string service_name, std::string path) {
    D_RET_IF_CODE(mode_ != Mode::kUnbound, Status::kInvalidState, "object is already bound");
    D_RET_IF_CODE(!bus, Status::kInvalidArgument, "bus must not be null");
    D_RET_IF_CODE(!is_valid_bus_name(service_name), Status::kInvalidArgument,
            "invalid service name \"" << service_name << "\"");
    D_RET_IF_CODE(!is_valid_object_path(path), Status::kInvalidArgument,
            "invalid object path \"" << path << "\"");

    bus_ = bus;
    remote_name_ = std::move(service_name);
    object_path_ = std::move(path);
    mode_ = Mode::kProxy;

    D_LOG_D(logger(), "connected proxy to " << remote_name_ << " " << object_path_);
    return RichStatus::success();
}

std::vector<ServerInterface> Object::describe_interfaces(bool include_unservable) const {
    return describe_table(*table_, include_unservable);
}

RichStatus Object::start_serving(Bus* bus, std::string path) {
    D_RET_IF_CODE(mode_ != Mode::kUnbound, Status::kInvalidState, "object is already bound");
    D_RET_IF_CODE(!bus, Status::kInvalidArgument, "bus must not be null");
    D_RET_IF_CODE(!is_valid_object_path(path), Status::kInvalidArgument,
            "invalid object path \"" << path << "\"");

    std::vector<std::unique_ptr<ServerBinding>> bindings;
    std::vector<std::unique_ptr<ServerInterface>> interfaces;

    for (auto& description: describe_interfaces(false)) {
        auto intf = std::make_unique<ServerInterface>(std::move(description));

        for (auto& method: intf->methods) {
            bindings.push_back(std::make_unique<ServerBinding>(ServerBinding{this, method.descriptor}));
            method.on_call = MEMBER_CB(bindings.back().get(), handle_call);
        }
        for (auto& property: intf->properties) {
            bindings.push_back(std::make_unique<ServerBinding>(ServerBinding{this, property.descriptor}));
            property.on_get = MEMBER_CB(bindings.back().get(), handle_get);
            if (property.descriptor->is_writable()) {
                property.on_set = MEMBER_CB(bindings.back().get(), handle_set);
            }
        }

        interfaces.push_back(std::move(intf));
    }

    for (size_t i = 0; i < interfaces.size(); ++i) {
        RichStatus status = bus->add_interface(path, interfaces[i].get());
        if (status.is_error()) {
            // Roll back what was registered so far
            for (size_t j = 0; j < i; ++j) {
                D_LOG_IF_ERR(bus->logger(), bus->remove_interface(interfaces[j].get()),
                        "failed to roll back " << interfaces[j]->name);
            }
            return D_AMEND_ERR(status, "failed to register " << interfaces[i]->name << " at " << path);
        }
    }

    bus_ = bus;
    object_path_ = std::move(path);
    server_bindings_ = std::move(bindings);
    served_interfaces_ = std::move(interfaces);
    mode_ = Mode::kServing;

    D_LOG_D(logger(), "serving " << served_interfaces_.size() << " interfaces at " << object_path_);
    return RichStatus::success();
}

void Object::stop_serving() {
    for (auto& intf: served_interfaces_) {
        D_LOG_IF_ERR(logger(), bus_->remove_interface(intf.get()),
                "failed to deregister " << intf->name << " at " << object_path_);
    }
    served_interfaces_.clear();
    server_bindings_.clear();
}

BoundMethod Object::method(const std::string& key) {
    return {table_->find_method(key), this};
}

BoundProperty Object::property(const std::string& key) {
    return {table_->find_property(key), this};
}

BoundSignal Object::signal(const std::string& key) {
    return {table_->find_signal(key), this};
}

void Object::handle_local_queue_closed(SignalQueue* queue) {
    for (auto it = local_signal_queues_.begin(); it != local_signal_queues_.end(); ) {
        auto& queues = it->second;
        queues.erase(std::remove(queues.begin(), queues.end(), queue), queues.end());
        if (queues.empty()) {
            it = local_signal_queues_.erase(it);
        } else {
            ++it;
        }
    }
}

void Object::push_to_local_queues(const SignalDescriptor* signal, const Value& value) {
    auto it = local_signal_queues_.find(signal);
    if (it == local_signal_queues_.end()) {
        return;
    }

    // A subscriber callback may open or close queues while we iterate, so
    // iterate over a snapshot and skip queues that are gone.
    std::vector<SignalQueue*> snapshot = it->second;
    for (SignalQueue* queue: snapshot) {
        auto current = local_signal_queues_.find(signal);
        if (current == local_signal_queues_.end()) {
            return;
        }
        if (std::find(current->second.begin(), current->second.end(), queue) != current->second.end()) {
            queue->push(value);
        }
    }
}

void Object::ServerBinding::handle_call(const ValueList& args, MethodReply on_reply) {
    BoundMethod{static_cast<const MethodDescriptor*>(descriptor), obj}.dispatch(args, on_reply);
}

RichStatus Object::ServerBinding::handle_get(Value* value) {
    return BoundProperty{static_cast<const PropertyDescriptor*>(descriptor), obj}.get_sync(value);
}

RichStatus Object::ServerBinding::handle_set(const Value& value) {
    return BoundProperty{static_cast<const PropertyDescriptor*>(descriptor), obj}.set_sync(value);
}
