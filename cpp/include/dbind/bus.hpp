#ifndef __DBIND_BUS_HPP
#define __DBIND_BUS_HPP

#include <dbind/callback.hpp>
#include <dbind/descriptors.hpp>
#include <dbind/interface.hpp>
#include <dbind/logging.hpp>
#include <dbind/rich_status.hpp>
#include <dbind/value.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace dbind {

class EventLoop;

/**
 * @brief FIFO of signal payloads with at most one pending reader.
 *
 * A queue is created by a subscription and owned by the subscriber. It
 * collects every payload pushed after its creation. Destroying the queue
 * cancels the subscription.
 */
class SignalQueue {
public:
    using on_close_t = Callback<void, SignalQueue*>;

    explicit SignalQueue(on_close_t on_close = {}) : on_close_(on_close) {}
    ~SignalQueue();

    SignalQueue(const SignalQueue&) = delete;
    SignalQueue& operator=(const SignalQueue&) = delete;

    /**
     * @brief Delivers the next payload to `on_value`.
     *
     * If a payload is already queued the callback runs before this function
     * returns, otherwise it runs when the next payload is pushed. Fails with
     * Status::kInvalidState if another reader is already waiting.
     */
    RichStatus next(Callback<void, Value> on_value);

    /**
     * @brief Withdraws a pending next() request. Queued payloads are kept.
     */
    void cancel_next();

    bool has_pending_next() const { return on_value_.has_value(); }
    size_t backlog() const { return backlog_.size(); }

    /**
     * @brief Called by the producer to deliver a payload.
     */
    void push(Value value);

    /**
     * @brief Called by the producer when it goes away before the queue does.
     * The queue stays usable but receives no further payloads.
     */
    void detach() { on_close_ = {}; }

private:
    std::deque<Value> backlog_;
    Callback<void, Value> on_value_;
    on_close_t on_close_;
};

struct MethodCall {
    std::string destination;
    std::string path;
    std::string interface_name;
    std::string member;
    std::string signature;
    ValueList args;
    bool no_reply = false;
};

struct SignalEmission {
    std::string path;
    std::string interface_name;
    std::string member;
    std::string signature;
    ValueList args;
};

struct SignalMatch {
    std::string sender;
    std::string path;
    std::string interface_name;
    std::string member;
};

/**
 * @brief Completion of a remote method call. On success carries the reply
 * arguments.
 */
using ReplyCallback = Callback<void, RichStatus, ValueList>;

struct ServerMethod {
    const MethodDescriptor* descriptor;
    Callback<void, const ValueList&, MethodReply> on_call;
};

struct ServerProperty {
    const PropertyDescriptor* descriptor;
    Callback<RichStatus, Value*> on_get;
    Callback<RichStatus, const Value&> on_set; //!< Empty for read-only properties
};

/**
 * @brief Everything the bus needs to serve one interface of one object.
 *
 * The interface is owned by whoever registers it and must stay alive until
 * it is removed from the bus.
 */
struct ServerInterface {
    std::string name;
    std::vector<ServerMethod> methods;
    std::vector<ServerProperty> properties;
    std::vector<const SignalDescriptor*> signals;

    const ServerMethod* find_method(const std::string& member) const;
    const ServerProperty* find_property(const std::string& member) const;
};

/**
 * @brief Groups the members of a table into one ServerInterface per interface
 * name, in declaration order. Only the metadata is filled in, the callbacks
 * are left empty.
 *
 * Members without interface name are never included. Members whose
 * interface was declared with serving disabled are only included if
 * `include_unservable` is true.
 */
std::vector<ServerInterface> describe_table(const InterfaceTable& table, bool include_unservable);

/**
 * @brief Connection to a message bus.
 *
 * All functions must be called on the thread of the event loop that runs the
 * bus and all callbacks are invoked on that thread.
 */
class Bus {
public:
    virtual ~Bus() = default;

    /**
     * @brief Sends a method call and invokes `on_reply` once the reply
     * arrives.
     *
     * If this function fails, `on_reply` is not invoked. Error replies are
     * delivered as Status::kRemoteError carrying the D-Bus error name. For
     * calls with `no_reply` set, `on_reply` runs as soon as the message is
     * queued.
     */
    virtual RichStatus call_async(const MethodCall& call, ReplyCallback on_reply) = 0;

    virtual RichStatus emit_signal(const SignalEmission& signal) = 0;

    /**
     * @brief Opens a queue that receives the payloads of all signals that
     * match `match`.
     */
    virtual RichStatus open_signal_queue(const SignalMatch& match, std::unique_ptr<SignalQueue>* p_queue) = 0;

    /**
     * @brief Makes an interface reachable at the given object path. The
     * interface pointer serves as handle for remove_interface().
     */
    virtual RichStatus add_interface(const std::string& path, ServerInterface* intf) = 0;
    virtual RichStatus remove_interface(ServerInterface* intf) = 0;

    const Logger& logger() const { return logger_; }

protected:
    Logger logger_ = Logger::none();
};

/**
 * @brief Returns the process-wide bus, connecting it on first use.
 *
 * The bus type is selected by the environment variable `DBIND_BUS`
 * ("session" or "system", default "session"). Later calls return the same
 * instance regardless of their arguments.
 */
RichStatus get_default_bus(EventLoop* event_loop, Logger logger, Bus** p_bus);

}

#endif // __DBIND_BUS_HPP
