#ifndef __DBIND_OBJECT_HPP
#define __DBIND_OBJECT_HPP

#include <dbind/bus.hpp>
#include <dbind/interface.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct BusTest;

namespace dbind {

class Object;

/**
 * @brief A method descriptor bound to an object.
 *
 * Bound members are cheap, transient and do not own anything. Obtain them
 * through Object::method().
 */
class BoundMethod {
public:
    BoundMethod(const MethodDescriptor* descriptor, Object* obj)
        : descriptor_(descriptor), obj_(obj) {}

    const MethodDescriptor* descriptor() const { return descriptor_; }
    Object* object() const { return obj_; }

    /**
     * @brief Calls the method.
     *
     * On a proxy the call goes over the bus, otherwise the implementation is
     * invoked directly. Argument errors are reported through `on_done`
     * before anything is sent.
     */
    void call(const ValueList& args, const KeywordArgs& kwargs, MethodReply on_done) const;
    void call(const ValueList& args, MethodReply on_done) const;

    /**
     * @brief Entry point for calls that arrived over the bus. Always runs the
     * local implementation and never lets an exception escape.
     */
    void dispatch(const ValueList& args, MethodReply on_reply) const;

private:
    void call_remote(ValueList args, MethodReply on_done) const;

    const MethodDescriptor* descriptor_;
    Object* obj_;
};

class BoundProperty {
public:
    BoundProperty(const PropertyDescriptor* descriptor, Object* obj)
        : descriptor_(descriptor), obj_(obj) {}

    const PropertyDescriptor* descriptor() const { return descriptor_; }
    Object* object() const { return obj_; }

    /**
     * @brief Reads the property through the local getter, also on proxies.
     */
    RichStatus get_sync(Value* value) const;

    /**
     * @brief Writes the property through the local setter. Fails with
     * Status::kNoSetter for read-only properties.
     */
    RichStatus set_sync(const Value& value) const;

    /**
     * @brief Reads the property. On a proxy this asks the remote object via
     * org.freedesktop.DBus.Properties.Get.
     */
    void get_async(Callback<void, RichStatus, Value> on_done) const;

    /**
     * @brief Writes the property. On a proxy this goes through
     * org.freedesktop.DBus.Properties.Set.
     */
    void set_async(const Value& value, Callback<void, RichStatus> on_done) const;

private:
    const PropertyDescriptor* descriptor_;
    Object* obj_;
};

class BoundSignal {
public:
    BoundSignal(const SignalDescriptor* descriptor, Object* obj)
        : descriptor_(descriptor), obj_(obj) {}

    const SignalDescriptor* descriptor() const { return descriptor_; }
    Object* object() const { return obj_; }

    /**
     * @brief Opens a new subscription.
     *
     * On a proxy the queue receives the signals of the remote object.
     * Otherwise it receives what is emitted locally on this object.
     */
    RichStatus subscribe(std::unique_ptr<SignalQueue>* p_queue) const;

    /**
     * @brief Emits the signal.
     *
     * If the object is being served, the signal is sent on the bus unless it
     * has no interface name. In any case the value is pushed to all local
     * subscribers. A failure to send does not prevent local delivery.
     */
    RichStatus emit(const Value& value = Value{}) const;

private:
    const SignalDescriptor* descriptor_;
    Object* obj_;
};

/**
 * @brief Base class of all objects with a D-Bus interface.
 *
 * An object starts out unbound. It can then either be connected to a remote
 * object (and act as a proxy for it) or be served on a bus. Both transitions
 * are permanent.
 */
class Object {
public:
    enum class Mode {
        kUnbound,
        kProxy,
        kServing,
    };

    explicit Object(InterfaceTablePtr table);
    virtual ~Object();

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    const InterfaceTable& table() const { return *table_; }
    Mode mode() const { return mode_; }
    bool is_proxy() const { return mode_ == Mode::kProxy; }
    Bus* bus() const { return bus_; }
    const std::string& remote_name() const { return remote_name_; }
    const std::string& object_path() const { return object_path_; }

    /** @brief Number of interfaces currently registered on the bus. */
    size_t n_served_interfaces() const { return served_interfaces_.size(); }

    /**
     * @brief Turns this object into a proxy for the object at `path` owned by
     * the bus peer `service_name`.
     */
    RichStatus connect(Bus* bus, std::string service_name, std::string path);

    /**
     * @brief Registers all servable interfaces of this object on the bus.
     *
     * Members whose interface was declared with serving disabled or without
     * an interface name are not exported.
     */
    RichStatus start_serving(Bus* bus, std::string path);

    /**
     * @brief Returns the bound member for the given key. The descriptor of
     * the bound member is null if the key is unknown or has a different
     * kind.
     */
    BoundMethod method(const std::string& key);
    BoundProperty property(const std::string& key);
    BoundSignal signal(const std::string& key);

    /**
     * @brief Describes the interfaces of this object. See describe_table().
     */
    std::vector<ServerInterface> describe_interfaces(bool include_unservable) const;

    const Logger& logger() const;

private:
    friend class BoundSignal;
    friend struct ::BusTest;

    struct ServerBinding {
        Object* obj;
        const MemberDescriptor* descriptor;

        void handle_call(const ValueList& args, MethodReply on_reply);
        RichStatus handle_get(Value* value);
        RichStatus handle_set(const Value& value);
    };

    void handle_local_queue_closed(SignalQueue* queue);
    void push_to_local_queues(const SignalDescriptor* signal, const Value& value);
    void stop_serving();

    InterfaceTablePtr table_;
    Mode mode_ = Mode::kUnbound;
    Bus* bus_ = nullptr;
    std::string remote_name_;
    std::string object_path_;

    std::vector<std::unique_ptr<ServerBinding>> server_bindings_;
    std::vector<std::unique_ptr<ServerInterface>> served_interfaces_;
    std::unordered_map<const SignalDescriptor*, std::vector<SignalQueue*>> local_signal_queues_;
};

/**
 * @brief Creates an object of type T and connects it to a remote object.
 *
 * T must be default constructible.
 */
template<typename T>
RichStatus make_proxy(Bus* bus, std::string service_name, std::string path, std::unique_ptr<T>* p_proxy) {
    std::unique_ptr<T> proxy = std::make_unique<T>();
    D_RET_IF_ERR(proxy->connect(bus, std::move(service_name), std::move(path)), "failed to connect proxy");
    if (p_proxy) {
        *p_proxy = std::move(proxy);
    }
    return RichStatus::success();
}

}

#endif // __DBIND_OBJECT_HPP
