/**
 * @brief Bus implementation on top of the low level library libdbus.
 *
 * The connection is driven by an EventLoop: libdbus watches are registered as
 * file descriptor events and libdbus timeouts as timers. Incoming messages
 * are dispatched on the event loop thread.
 *
 * Besides the methods of registered interfaces, the bus answers
 * org.freedesktop.DBus.Properties and org.freedesktop.DBus.Introspectable
 * for every registered object path. org.freedesktop.DBus.Peer is answered by
 * libdbus itself.
 */

#ifndef __DBIND_LIBDBUS_BUS_HPP
#define __DBIND_LIBDBUS_BUS_HPP

#include <dbind/bus.hpp>
#include <dbind/event_loop.hpp>
#include <dbus/dbus.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dbind {

class LibDBusBus final : public Bus {
public:
    LibDBusBus() = default;
    ~LibDBusBus();

    LibDBusBus(const LibDBusBus&) = delete;
    LibDBusBus& operator=(const LibDBusBus&) = delete;

    /**
     * @brief Connects to the session or system bus.
     *
     * Blocks until the bus daemon assigned a unique name. Must be called on
     * the event loop thread.
     */
    RichStatus open(EventLoop* event_loop, Logger logger, DBusBusType type);

    /**
     * @brief Connects to the bus at the given address (e.g.
     * "unix:path=/run/dbus/system_bus_socket").
     */
    RichStatus open_address(EventLoop* event_loop, Logger logger, const std::string& address);

    /**
     * @brief Closes the connection.
     *
     * Pending remote calls complete with Status::kBusError. Signal queues
     * that are still open stay valid but receive nothing further.
     */
    RichStatus close();

    DBusConnection* get_libdbus_ptr() { return conn_; }
    std::string unique_name() const;

    /**
     * @brief Asks the bus daemon for a well-known name.
     *
     * `on_done` receives success if this connection became the primary
     * owner of the name (or already was).
     */
    RichStatus request_name(const std::string& name, uint32_t flags, Callback<void, RichStatus> on_done);

    RichStatus call_async(const MethodCall& call, ReplyCallback on_reply) final;
    RichStatus emit_signal(const SignalEmission& signal) final;
    RichStatus open_signal_queue(const SignalMatch& match, std::unique_ptr<SignalQueue>* p_queue) final;
    RichStatus add_interface(const std::string& path, ServerInterface* intf) final;
    RichStatus remove_interface(ServerInterface* intf) final;

private:
    struct WatchSlot {
        LibDBusBus* parent;
        int fd;
        std::vector<DBusWatch*> watches;
        uint32_t events = 0; // currently registered epoll events, 0 if none
        void on_event(uint32_t mask);
    };

    struct TimeoutContext {
        LibDBusBus* parent;
        DBusTimeout* timeout;
        Timer* timer;
        void on_trigger();
    };

    struct PendingCall {
        LibDBusBus* parent;
        DBusPendingCall* pending;
        ReplyCallback on_reply;
    };

    struct PendingReply {
        LibDBusBus* parent; // null once the bus is closed
        DBusMessage* call;
        std::string result_signature;
        void on_reply(RichStatus status, Value value);
    };

    struct Subscription {
        LibDBusBus* parent;
        SignalMatch match;
        std::string rule;
        SignalQueue* queue;
        void on_queue_closed(SignalQueue* queue);
    };

    struct Registration {
        std::string path;
        ServerInterface* intf;
    };

    RichStatus setup_connection(EventLoop* event_loop, Logger logger, DBusConnection* conn);

    dbus_bool_t handle_add_watch(DBusWatch* watch);
    void handle_remove_watch(DBusWatch* watch);
    void handle_toggle_watch(DBusWatch* watch);
    RichStatus update_watch_slot(WatchSlot* slot);

    dbus_bool_t handle_add_timeout(DBusTimeout* timeout);
    void handle_remove_timeout(DBusTimeout* timeout);
    void handle_toggle_timeout(DBusTimeout* timeout);

    void schedule_dispatch();
    void handle_dispatch(uint32_t);

    static void handle_pending_call_stub(DBusPendingCall* pending, void* ctx);
    void handle_pending_call(PendingCall* call);

    static DBusHandlerResult handle_message_stub(DBusConnection* conn, DBusMessage* msg, void* ctx);
    DBusHandlerResult handle_message(DBusMessage* msg);
    void handle_signal(DBusMessage* msg);
    DBusHandlerResult handle_method_call(DBusMessage* msg);
    DBusHandlerResult handle_properties_call(DBusMessage* msg, const char* path, const char* member);
    DBusHandlerResult handle_introspect(DBusMessage* msg, const char* path);
    void emit_properties_changed(const std::string& path, const ServerInterface* intf,
                                 const PropertyDescriptor* desc, const Value& value);

    const ServerInterface* find_interface(const std::string& path, const std::string& name) const;
    const ServerProperty* find_property(const std::string& path, const std::string& intf_name,
                                        const std::string& name, const ServerInterface** p_intf) const;
    bool has_path(const std::string& path) const;
    std::vector<std::string> child_nodes(const std::string& path) const;

    void send_reply(DBusMessage* call, const std::string& signature, const ValueList& args);
    void send_error(DBusMessage* call, const char* error_name, const std::string& message);
    void send_error(DBusMessage* call, const RichStatus& status);

    void remove_subscription(Subscription* subscription);

    EventLoop* event_loop_ = nullptr;
    DBusConnection* conn_ = nullptr;
    bool filter_added_ = false;
    int dispatch_fd_ = -1;
    bool dispatch_pending_ = false;

    std::unordered_map<int, std::unique_ptr<WatchSlot>> watch_slots_;
    std::unordered_set<PendingCall*> pending_calls_;
    std::unordered_set<PendingReply*> pending_replies_;
    std::vector<std::unique_ptr<Subscription>> subscriptions_;
    std::vector<Registration> registrations_;
};

}

#endif // __DBIND_LIBDBUS_BUS_HPP
