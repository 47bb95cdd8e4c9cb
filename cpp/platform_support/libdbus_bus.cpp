#include "libdbus_bus.hpp"
#include <dbind/codec.hpp>
#include <dbind/introspection.hpp>
#include <dbind/name_utils.hpp>
#include <dbind/standard_interfaces.hpp>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <string.h>
#include <algorithm>
#include <exception>

using namespace dbind;

LibDBusBus::~LibDBusBus() {
    if (conn_) {
        D_LOG_IF_ERR(logger_, close(), "failed to close bus");
    }
}

RichStatus LibDBusBus::open(EventLoop* event_loop, Logger logger, DBusBusType type) {
    D_RET_IF_CODE(conn_, Status::kInvalidState, "already open");
    D_RET_IF_CODE(!event_loop, Status::kInvalidArgument, "event loop must not be null");

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get_private(type, &err);
    if (dbus_error_is_set(&err)) {
        RichStatus status = D_MAKE_ERR_CODE(Status::kBusError, "dbus_bus_get_private() failed: " << err.message)
                .with_error_name(err.name);
        dbus_error_free(&err);
        return status;
    }
    D_RET_IF_CODE(!conn, Status::kBusError, "dbus_bus_get_private() returned NULL");

    return setup_connection(event_loop, logger, conn);
}

RichStatus LibDBusBus::open_address(EventLoop* event_loop, Logger logger, const std::string& address) {
    D_RET_IF_CODE(conn_, Status::kInvalidState, "already open");
    D_RET_IF_CODE(!event_loop, Status::kInvalidArgument, "event loop must not be null");

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_connection_open_private(address.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        RichStatus status = D_MAKE_ERR_CODE(Status::kBusError, "failed to connect to " << address << ": " << err.message)
                .with_error_name(err.name);
        dbus_error_free(&err);
        return status;
    }
    D_RET_IF_CODE(!conn, Status::kBusError, "dbus_connection_open_private() returned NULL");

    if (!dbus_bus_register(conn, &err)) {
        RichStatus status = D_MAKE_ERR_CODE(Status::kBusError, "dbus_bus_register() failed: "
                << (dbus_error_is_set(&err) ? err.message : "unknown error"));
        dbus_error_free(&err);
        dbus_connection_close(conn);
        dbus_connection_unref(conn);
        return status;
    }

    return setup_connection(event_loop, logger, conn);
}

RichStatus LibDBusBus::setup_connection(EventLoop* event_loop, Logger logger, DBusConnection* conn) {
    event_loop_ = event_loop;
    logger_ = logger;
    conn_ = conn;

    dbus_connection_set_exit_on_disconnect(conn_, FALSE);

    RichStatus status;

    dispatch_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (dispatch_fd_ < 0) {
        status = D_MAKE_ERR_CODE(Status::kBusError, "eventfd() failed: " << sys_err());
        goto fail;
    }

    if ((status = event_loop_->register_event(dispatch_fd_, EPOLLIN, MEMBER_CB(this, handle_dispatch))).is_error()) {
        ::close(dispatch_fd_);
        dispatch_fd_ = -1;
        status = D_AMEND_ERR(status, "failed to register dispatch event");
        goto fail;
    }

    if (!dbus_connection_set_watch_functions(conn_,
        [](DBusWatch* watch, void* data) { /* add_function */
            return ((LibDBusBus*)data)->handle_add_watch(watch);
        },
        [](DBusWatch* watch, void* data) { /* remove_function */
            ((LibDBusBus*)data)->handle_remove_watch(watch);
        },
        [](DBusWatch* watch, void* data) { /* toggled_function */
            ((LibDBusBus*)data)->handle_toggle_watch(watch);
        },
        this, /* data */
        nullptr /* free_data_function */
    )) {
        status = D_MAKE_ERR_CODE(Status::kBusError, "dbus_connection_set_watch_functions() failed");
        goto fail;
    }

    if (!dbus_connection_set_timeout_functions(conn_,
        [](DBusTimeout* timeout, void* data) { /* add_function */
            return ((LibDBusBus*)data)->handle_add_timeout(timeout);
        },
        [](DBusTimeout* timeout, void* data) { /* remove_function */
            ((LibDBusBus*)data)->handle_remove_timeout(timeout);
        },
        [](DBusTimeout* timeout, void* data) { /* toggled_function */
            ((LibDBusBus*)data)->handle_toggle_timeout(timeout);
        },
        this, /* data */
        nullptr /* free_data_function */
    )) {
        status = D_MAKE_ERR_CODE(Status::kBusError, "dbus_connection_set_timeout_functions() failed");
        goto fail;
    }

    dbus_connection_set_wakeup_main_function(conn_,
        [](void* data) {
            ((LibDBusBus*)data)->schedule_dispatch();
        }, this, nullptr);

    dbus_connection_set_dispatch_status_function(conn_,
        [](DBusConnection*, DBusDispatchStatus new_status, void* data) {
            if (new_status == DBUS_DISPATCH_DATA_REMAINS) {
                ((LibDBusBus*)data)->schedule_dispatch();
            }
        }, this, nullptr);

    if (!dbus_connection_add_filter(conn_, handle_message_stub, this, nullptr)) {
        status = D_MAKE_ERR_CODE(Status::kBusError, "failed to add filter");
        goto fail;
    }
    filter_added_ = true;

    if (dbus_connection_get_dispatch_status(conn_) == DBUS_DISPATCH_DATA_REMAINS) {
        schedule_dispatch();
    }

    D_LOG_D(logger_, "my name on the bus is " << unique_name());
    return RichStatus::success();

fail:
    D_LOG_IF_ERR(logger_, close(), "failed to clean up");
    return status;
}

RichStatus LibDBusBus::close() {
    D_RET_IF_CODE(!conn_, Status::kInvalidState, "not open");

    RichStatus status;

    std::vector<ReplyCallback> aborted_calls;
    for (PendingCall* call: pending_calls_) {
        dbus_pending_call_cancel(call->pending);
        dbus_pending_call_unref(call->pending);
        aborted_calls.push_back(call->on_reply);
        delete call;
    }
    pending_calls_.clear();

    // Replies that are still being computed are dropped once they arrive.
    for (PendingReply* reply: pending_replies_) {
        reply->parent = nullptr;
    }
    pending_replies_.clear();

    for (auto& subscription: subscriptions_) {
        subscription->queue->detach();
    }
    subscriptions_.clear();
    registrations_.clear();

    if (filter_added_) {
        dbus_connection_remove_filter(conn_, handle_message_stub, this);
        filter_added_ = false;
    }
    dbus_connection_set_watch_functions(conn_, nullptr, nullptr, nullptr, nullptr, nullptr);
    dbus_connection_set_timeout_functions(conn_, nullptr, nullptr, nullptr, nullptr, nullptr);
    dbus_connection_set_dispatch_status_function(conn_, nullptr, nullptr, nullptr);
    dbus_connection_set_wakeup_main_function(conn_, nullptr, nullptr, nullptr);

    for (auto& it: watch_slots_) {
        if (it.second->events) {
            RichStatus deregister_status = event_loop_->deregister_event(it.first);
            if (deregister_status.is_error()) {
                status = D_AMEND_ERR(deregister_status, "failed to deregister watch");
            }
        }
    }
    watch_slots_.clear();

    if (dispatch_fd_ >= 0) {
        RichStatus deregister_status = event_loop_->deregister_event(dispatch_fd_);
        if (deregister_status.is_error()) {
            status = D_AMEND_ERR(deregister_status, "failed to deregister dispatch event");
        }
        if (::close(dispatch_fd_) != 0) {
            status = D_MAKE_ERR_CODE(Status::kBusError, "close() failed: " << sys_err());
        }
        dispatch_fd_ = -1;
    }
    dispatch_pending_ = false;

    D_LOG_D(logger_, "will close connection");
    dbus_connection_close(conn_);
    dbus_connection_unref(conn_);
    conn_ = nullptr;
    D_LOG_D(logger_, "connection closed");

    for (auto& on_reply: aborted_calls) {
        on_reply.invoke(D_MAKE_ERR_CODE(Status::kBusError, "bus was closed"), {});
    }

    return status;
}

std::string LibDBusBus::unique_name() const {
    const char* name = conn_ ? dbus_bus_get_unique_name(conn_) : nullptr;
    return name ? name : "";
}

/* Event loop integration ----------------------------------------------------*/

dbus_bool_t LibDBusBus::handle_add_watch(DBusWatch* watch) {
    int fd = dbus_watch_get_unix_fd(watch);
    D_LOG_T(logger_, "add watch for fd " << fd);

    // libdbus may create separate watches for reading and writing on the
    // same fd but the event loop accepts only one registration per fd.
    auto& slot = watch_slots_[fd];
    if (!slot) {
        slot = std::unique_ptr<WatchSlot>(new WatchSlot{this, fd, {}, 0});
    }
    slot->watches.push_back(watch);

    return D_LOG_IF_ERR(logger_, update_watch_slot(slot.get()), "failed to add watch") ? FALSE : TRUE;
}

void LibDBusBus::handle_remove_watch(DBusWatch* watch) {
    int fd = dbus_watch_get_unix_fd(watch);
    D_LOG_T(logger_, "remove watch for fd " << fd);

    auto it = watch_slots_.find(fd);
    if (it == watch_slots_.end()) {
        D_LOG_E(logger_, "unknown watch removed");
        return;
    }

    // The slot itself stays allocated until the bus is closed because this
    // can run from within WatchSlot::on_event().
    auto& watches = it->second->watches;
    watches.erase(std::remove(watches.begin(), watches.end(), watch), watches.end());
    D_LOG_IF_ERR(logger_, update_watch_slot(it->second.get()), "failed to remove watch");
}

void LibDBusBus::handle_toggle_watch(DBusWatch* watch) {
    auto it = watch_slots_.find(dbus_watch_get_unix_fd(watch));
    if (it == watch_slots_.end()) {
        D_LOG_E(logger_, "unknown watch toggled");
        return;
    }
    D_LOG_IF_ERR(logger_, update_watch_slot(it->second.get()), "failed to toggle watch");
}

RichStatus LibDBusBus::update_watch_slot(WatchSlot* slot) {
    uint32_t events = 0;
    for (DBusWatch* watch: slot->watches) {
        if (!dbus_watch_get_enabled(watch)) {
            continue;
        }
        unsigned int flags = dbus_watch_get_flags(watch);
        if (flags & DBUS_WATCH_READABLE)
            events |= EPOLLIN;
        if (flags & DBUS_WATCH_WRITABLE)
            events |= EPOLLOUT;
    }

    if (events == slot->events) {
        return RichStatus::success();
    }

    if (!slot->events) {
        D_RET_IF_ERR(event_loop_->register_event(slot->fd, events, MEMBER_CB(slot, on_event)),
                "failed to register fd " << slot->fd);
    } else if (!events) {
        D_RET_IF_ERR(event_loop_->deregister_event(slot->fd), "failed to deregister fd " << slot->fd);
    } else {
        D_RET_IF_ERR(event_loop_->modify_event(slot->fd, events), "failed to modify fd " << slot->fd);
    }

    slot->events = events;
    return RichStatus::success();
}

void LibDBusBus::WatchSlot::on_event(uint32_t mask) {
    unsigned int flags = 0;
    if (mask & EPOLLIN)
        flags |= DBUS_WATCH_READABLE;
    if (mask & EPOLLOUT)
        flags |= DBUS_WATCH_WRITABLE;
    if (mask & EPOLLHUP)
        flags |= DBUS_WATCH_HANGUP;
    if (mask & EPOLLERR)
        flags |= DBUS_WATCH_ERROR;

    // dbus_watch_handle() can add or remove watches
    std::vector<DBusWatch*> snapshot = watches;
    for (DBusWatch* watch: snapshot) {
        if (std::find(watches.begin(), watches.end(), watch) == watches.end()
                || !dbus_watch_get_enabled(watch)) {
            continue;
        }
        unsigned int watch_flags = flags & (dbus_watch_get_flags(watch) | DBUS_WATCH_HANGUP | DBUS_WATCH_ERROR);
        if (watch_flags && !dbus_watch_handle(watch, watch_flags)) {
            D_LOG_E(parent->logger_, "dbus_watch_handle() failed");
        }
    }

    parent->schedule_dispatch();
}

dbus_bool_t LibDBusBus::handle_add_timeout(DBusTimeout* timeout) {
    D_LOG_T(logger_, "add timeout");
    TimeoutContext* ctx = new TimeoutContext{this, timeout, nullptr};

    if (D_LOG_IF_ERR(logger_, event_loop_->open_timer(&ctx->timer, MEMBER_CB(ctx, on_trigger)), "failed to open timer")) {
        delete ctx;
        return FALSE;
    }

    dbus_timeout_set_data(timeout, ctx, nullptr);

    // If the timeout is already supposed to be enabled, toggle it on now
    handle_toggle_timeout(timeout);
    return TRUE;
}

void LibDBusBus::handle_remove_timeout(DBusTimeout* timeout) {
    D_LOG_T(logger_, "remove timeout");
    TimeoutContext* ctx = (TimeoutContext*)dbus_timeout_get_data(timeout);
    if (!ctx) {
        return;
    }
    dbus_timeout_set_data(timeout, nullptr, nullptr);
    D_LOG_IF_ERR(logger_, event_loop_->close_timer(ctx->timer), "failed to close timer");
    delete ctx;
}

void LibDBusBus::handle_toggle_timeout(DBusTimeout* timeout) {
    TimeoutContext* ctx = (TimeoutContext*)dbus_timeout_get_data(timeout);
    if (!ctx) {
        return;
    }
    if (dbus_timeout_get_enabled(timeout)) {
        float interval = (float)dbus_timeout_get_interval(timeout) / 1000.0f;
        D_LOG_IF_ERR(logger_, ctx->timer->set(interval, TimerMode::kPeriodic), "failed to start timer");
    } else {
        D_LOG_IF_ERR(logger_, ctx->timer->set(0.0f, TimerMode::kNever), "failed to stop timer");
    }
}

void LibDBusBus::TimeoutContext::on_trigger() {
    D_LOG_T(parent->logger_, "handle timeout");
    if (!dbus_timeout_handle(timeout)) {
        D_LOG_E(parent->logger_, "dbus_timeout_handle() failed");
    }
    parent->schedule_dispatch();
}

void LibDBusBus::schedule_dispatch() {
    if (dispatch_pending_ || dispatch_fd_ < 0) {
        return;
    }
    const uint64_t val = 1;
    if (write(dispatch_fd_, &val, sizeof(val)) != sizeof(val)) {
        D_LOG_E(logger_, "failed to schedule dispatch: " << sys_err());
        return;
    }
    dispatch_pending_ = true;
}

void LibDBusBus::handle_dispatch(uint32_t) {
    uint64_t val;
    D_LOG_IF(logger_, read(dispatch_fd_, &val, sizeof(val)) != sizeof(val),
             "failed to read from dispatch file descriptor");
    dispatch_pending_ = false;

    // A message handler may close the bus
    while (conn_ && dbus_connection_dispatch(conn_) == DBUS_DISPATCH_DATA_REMAINS) {
        D_LOG_T(logger_, "dispatch");
    }
}

/* Outgoing messages ---------------------------------------------------------*/

RichStatus LibDBusBus::call_async(const MethodCall& call, ReplyCallback on_reply) {
    D_RET_IF_CODE(!conn_, Status::kInvalidState, "bus is not open");
    D_RET_IF_CODE(!call.destination.empty() && !is_valid_bus_name(call.destination), Status::kInvalidArgument,
            "invalid destination \"" << call.destination << "\"");
    D_RET_IF_CODE(!is_valid_object_path(call.path), Status::kInvalidArgument,
            "invalid object path \"" << call.path << "\"");
    D_RET_IF_CODE(!call.interface_name.empty() && !is_valid_interface_name(call.interface_name), Status::kInvalidArgument,
            "invalid interface name \"" << call.interface_name << "\"");
    D_RET_IF_CODE(!is_valid_member_name(call.member), Status::kInvalidArgument,
            "invalid method name \"" << call.member << "\"");

    DBusMessage* msg = dbus_message_new_method_call(
            call.destination.empty() ? nullptr : call.destination.c_str(),
            call.path.c_str(),
            call.interface_name.empty() ? nullptr : call.interface_name.c_str(),
            call.member.c_str());
    D_RET_IF_CODE(!msg, Status::kBusError, "out of memory");

    RichStatus status = pack_message(msg, call.signature, call.args);
    if (status.is_error()) {
        dbus_message_unref(msg);
        return D_AMEND_ERR(status, "failed to pack arguments of " << call.member);
    }

    D_LOG_D(logger_, "sending " << *msg);

    if (call.no_reply) {
        dbus_message_set_no_reply(msg, TRUE);
        dbus_bool_t sent = dbus_connection_send(conn_, msg, nullptr);
        dbus_message_unref(msg);
        D_RET_IF_CODE(!sent, Status::kBusError, "failed to send " << call.member);
        on_reply.invoke(RichStatus::success(), {});
        return RichStatus::success();
    }

    DBusPendingCall* pending = nullptr;
    dbus_bool_t sent = dbus_connection_send_with_reply(conn_, msg, &pending, DBIND_DEFAULT_CALL_TIMEOUT_MS);
    dbus_message_unref(msg);
    D_RET_IF_CODE(!sent, Status::kBusError, "out of memory");
    D_RET_IF_CODE(!pending, Status::kBusError, "connection is disconnected");

    PendingCall* ctx = new PendingCall{this, pending, on_reply};
    if (!dbus_pending_call_set_notify(pending, &handle_pending_call_stub, ctx, nullptr)) {
        dbus_pending_call_cancel(pending);
        dbus_pending_call_unref(pending);
        delete ctx;
        return D_MAKE_ERR_CODE(Status::kBusError, "failed to set pending call callback");
    }
    pending_calls_.insert(ctx);

    // Handle the reply now if it arrived before we set the notify callback.
    if (dbus_pending_call_get_completed(pending)) {
        handle_pending_call(ctx);
    }

    return RichStatus::success();
}

void LibDBusBus::handle_pending_call_stub(DBusPendingCall*, void* ctx) {
    PendingCall* call = (PendingCall*)ctx;
    call->parent->handle_pending_call(call);
}

void LibDBusBus::handle_pending_call(PendingCall* call) {
    if (!pending_calls_.erase(call)) {
        return; // already handled
    }

    DBusMessage* reply = dbus_pending_call_steal_reply(call->pending);
    dbus_pending_call_unref(call->pending);
    ReplyCallback on_reply = call->on_reply;
    delete call;

    if (!reply) {
        on_reply.invoke(D_MAKE_ERR_CODE(Status::kBusError, "pending call completed without reply"), {});
        return;
    }

    D_LOG_D(logger_, "received " << *reply);

    RichStatus status;
    ValueList args;
    if (dbus_message_get_type(reply) == DBUS_MESSAGE_TYPE_ERROR) {
        status = status_from_error_message(reply);
    } else if ((status = unpack_message(reply, &args)).is_error()) {
        status = D_AMEND_ERR(status, "failed to unpack reply");
    }
    dbus_message_unref(reply);

    on_reply.invoke(status, std::move(args));
}

RichStatus LibDBusBus::emit_signal(const SignalEmission& signal) {
    D_RET_IF_CODE(!conn_, Status::kInvalidState, "bus is not open");
    D_RET_IF_CODE(!is_valid_object_path(signal.path), Status::kInvalidArgument,
            "invalid object path \"" << signal.path << "\"");
    D_RET_IF_CODE(!is_valid_interface_name(signal.interface_name), Status::kInvalidArgument,
            "invalid interface name \"" << signal.interface_name << "\"");
    D_RET_IF_CODE(!is_valid_member_name(signal.member), Status::kInvalidArgument,
            "invalid signal name \"" << signal.member << "\"");

    DBusMessage* msg = dbus_message_new_signal(signal.path.c_str(), signal.interface_name.c_str(), signal.member.c_str());
    D_RET_IF_CODE(!msg, Status::kBusError, "out of memory");

    RichStatus status = pack_message(msg, signal.signature, signal.args);
    if (status.is_error()) {
        dbus_message_unref(msg);
        return D_AMEND_ERR(status, "failed to pack signal " << signal.member);
    }

    D_LOG_D(logger_, "sending " << *msg);

    dbus_bool_t sent = dbus_connection_send(conn_, msg, nullptr);
    dbus_message_unref(msg);
    D_RET_IF_CODE(!sent, Status::kBusError, "failed to send signal " << signal.member);
    return RichStatus::success();
}

struct RequestNameContext {
    Callback<void, RichStatus> on_done;
    std::string name;

    void on_reply(RichStatus status, ValueList args) {
        auto on_done_copy = on_done;
        std::string name_copy = name;
        delete this;

        uint32_t result = 0;
        if (status.is_error()) {
            on_done_copy.invoke(D_AMEND_ERR(status, "RequestName failed"));
        } else if (args.size() != 1 || from_value(args[0], &result).is_error()) {
            on_done_copy.invoke(D_MAKE_ERR_CODE(Status::kBusError, "unexpected reply to RequestName: " << args));
        } else if (result != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER && result != DBUS_REQUEST_NAME_REPLY_ALREADY_OWNER) {
            on_done_copy.invoke(D_MAKE_ERR_CODE(Status::kBusError, "name " << name_copy << " is owned by someone else (" << result << ")"));
        } else {
            on_done_copy.invoke(RichStatus::success());
        }
    }
};

RichStatus LibDBusBus::request_name(const std::string& name, uint32_t flags, Callback<void, RichStatus> on_done) {
    D_RET_IF_CODE(!is_valid_bus_name(name) || name[0] == ':', Status::kInvalidArgument,
            "invalid well-known name \"" << name << "\"");

    MethodCall call{DBUS_SERVICE_DBUS, DBUS_PATH_DBUS, DBUS_INTERFACE_DBUS, "RequestName", "su",
                    {Value{name}, Value{flags}}};
    RequestNameContext* ctx = new RequestNameContext{on_done, name};
    RichStatus status = call_async(call, MEMBER_CB(ctx, on_reply));
    if (status.is_error()) {
        delete ctx;
        return D_AMEND_ERR(status, "failed to request name " << name);
    }
    return RichStatus::success();
}

/* Signal subscriptions ------------------------------------------------------*/

RichStatus LibDBusBus::open_signal_queue(const SignalMatch& match, std::unique_ptr<SignalQueue>* p_queue) {
    D_RET_IF_CODE(!conn_, Status::kInvalidState, "bus is not open");
    D_RET_IF_CODE(!p_queue, Status::kInvalidArgument, "p_queue must not be null");
    D_RET_IF_CODE(!match.sender.empty() && !is_valid_bus_name(match.sender), Status::kInvalidArgument,
            "invalid sender \"" << match.sender << "\"");
    D_RET_IF_CODE(!match.path.empty() && !is_valid_object_path(match.path), Status::kInvalidArgument,
            "invalid object path \"" << match.path << "\"");
    D_RET_IF_CODE(!match.interface_name.empty() && !is_valid_interface_name(match.interface_name), Status::kInvalidArgument,
            "invalid interface name \"" << match.interface_name << "\"");
    D_RET_IF_CODE(!match.member.empty() && !is_valid_member_name(match.member), Status::kInvalidArgument,
            "invalid signal name \"" << match.member << "\"");

    std::string rule = "type='signal'";
    if (!match.sender.empty())
        rule += ",sender='" + match.sender + "'";
    if (!match.path.empty())
        rule += ",path='" + match.path + "'";
    if (!match.interface_name.empty())
        rule += ",interface='" + match.interface_name + "'";
    if (!match.member.empty())
        rule += ",member='" + match.member + "'";

    D_LOG_D(logger_, "adding rule " << rule << " to connection");

    // Without an error argument this does not block. The rule is active once
    // the message was sent.
    dbus_bus_add_match(conn_, rule.c_str(), nullptr);

    auto subscription = std::unique_ptr<Subscription>(new Subscription{this, match, rule, nullptr});
    auto queue = std::make_unique<SignalQueue>(MEMBER_CB(subscription.get(), on_queue_closed));
    subscription->queue = queue.get();
    subscriptions_.push_back(std::move(subscription));

    *p_queue = std::move(queue);
    return RichStatus::success();
}

void LibDBusBus::Subscription::on_queue_closed(SignalQueue*) {
    parent->remove_subscription(this);
}

void LibDBusBus::remove_subscription(Subscription* subscription) {
    if (conn_) {
        D_LOG_D(logger_, "removing rule " << subscription->rule);
        dbus_bus_remove_match(conn_, subscription->rule.c_str(), nullptr);
    }
    subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
            [&](const std::unique_ptr<Subscription>& ptr) { return ptr.get() == subscription; }),
            subscriptions_.end());
}

static bool field_matches(const std::string& expected, const char* actual) {
    return expected.empty() || (actual && expected == actual);
}

void LibDBusBus::handle_signal(DBusMessage* msg) {
    const char* sender = dbus_message_get_sender(msg);
    const char* path = dbus_message_get_path(msg);
    const char* intf = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    std::vector<Subscription*> matching;
    for (auto& subscription: subscriptions_) {
        const SignalMatch& match = subscription->match;
        // The sender field of a message is always a unique name. Well-known
        // names are resolved by the bus daemon through the match rule.
        bool sender_matches = match.sender.empty() || match.sender[0] != ':' || field_matches(match.sender, sender);
        if (sender_matches && field_matches(match.path, path)
                && field_matches(match.interface_name, intf) && field_matches(match.member, member)) {
            matching.push_back(subscription.get());
        }
    }

    if (matching.empty()) {
        return;
    }

    ValueList args;
    if (D_LOG_IF_ERR(logger_, unpack_message(msg, &args), "failed to unpack signal " << *msg)) {
        return;
    }
    Value payload = payload_to_value(std::move(args));

    for (Subscription* subscription: matching) {
        // A consumer may close other queues from within its callback
        auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                [&](const std::unique_ptr<Subscription>& ptr) { return ptr.get() == subscription; });
        if (it != subscriptions_.end()) {
            subscription->queue->push(payload);
        }
    }
}

/* Served interfaces ---------------------------------------------------------*/

RichStatus LibDBusBus::add_interface(const std::string& path, ServerInterface* intf) {
    D_RET_IF_CODE(!intf, Status::kInvalidArgument, "interface must not be null");
    D_RET_IF_CODE(!is_valid_object_path(path), Status::kInvalidArgument, "invalid object path \"" << path << "\"");
    D_RET_IF_CODE(!is_valid_interface_name(intf->name), Status::kInvalidArgument,
            "invalid interface name \"" << intf->name << "\"");
    D_RET_IF_CODE(find_interface(path, intf->name), Status::kInvalidArgument,
            "interface " << intf->name << " is already registered at " << path);

    registrations_.push_back({path, intf});
    D_LOG_D(logger_, "registered " << intf->name << " at " << path);
    return RichStatus::success();
}

RichStatus LibDBusBus::remove_interface(ServerInterface* intf) {
    auto it = std::find_if(registrations_.begin(), registrations_.end(),
            [&](const Registration& reg) { return reg.intf == intf; });
    D_RET_IF_CODE(it == registrations_.end(), Status::kInvalidArgument, "interface is not registered");
    D_LOG_D(logger_, "deregistered " << intf->name << " at " << it->path);
    registrations_.erase(it);
    return RichStatus::success();
}

const ServerInterface* LibDBusBus::find_interface(const std::string& path, const std::string& name) const {
    for (auto& reg: registrations_) {
        if (reg.path == path && reg.intf->name == name) {
            return reg.intf;
        }
    }
    return nullptr;
}

const ServerProperty* LibDBusBus::find_property(const std::string& path, const std::string& intf_name,
                                                const std::string& name, const ServerInterface** p_intf) const {
    for (auto& reg: registrations_) {
        if (reg.path != path || (!intf_name.empty() && reg.intf->name != intf_name)) {
            continue;
        }
        if (const ServerProperty* property = reg.intf->find_property(name)) {
            *p_intf = reg.intf;
            return property;
        }
    }
    return nullptr;
}

bool LibDBusBus::has_path(const std::string& path) const {
    return std::any_of(registrations_.begin(), registrations_.end(),
            [&](const Registration& reg) { return reg.path == path; });
}

std::vector<std::string> LibDBusBus::child_nodes(const std::string& path) const {
    std::string prefix = path == "/" ? path : path + "/";
    std::vector<std::string> result;
    for (auto& reg: registrations_) {
        if (reg.path.size() <= prefix.size() || reg.path.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string rest = reg.path.substr(prefix.size());
        std::string child = rest.substr(0, rest.find('/'));
        if (std::find(result.begin(), result.end(), child) == result.end()) {
            result.push_back(child);
        }
    }
    return result;
}

DBusHandlerResult LibDBusBus::handle_message_stub(DBusConnection*, DBusMessage* msg, void* ctx) {
    return ((LibDBusBus*)ctx)->handle_message(msg);
}

DBusHandlerResult LibDBusBus::handle_message(DBusMessage* msg) {
    // Exceptions must not propagate into libdbus
    try {
        switch (dbus_message_get_type(msg)) {
            case DBUS_MESSAGE_TYPE_SIGNAL:
                handle_signal(msg);
                return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
            case DBUS_MESSAGE_TYPE_METHOD_CALL:
                return handle_method_call(msg);
            default:
                return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
        }
    } catch (const std::exception& ex) {
        D_LOG_E(logger_, "exception while handling " << *msg << ": " << ex.what());
        return DBUS_HANDLER_RESULT_HANDLED;
    }
}

DBusHandlerResult LibDBusBus::handle_method_call(DBusMessage* msg) {
    const char* path = dbus_message_get_path(msg);
    const char* intf_name = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    if (!path || !member) {
        D_LOG_W(logger_, "malformed method call: " << *msg);
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    if (intf_name && !strcmp(intf_name, DBUS_INTERFACE_PROPERTIES)) {
        return handle_properties_call(msg, path, member);
    }
    if (intf_name && !strcmp(intf_name, DBUS_INTERFACE_INTROSPECTABLE) && !strcmp(member, "Introspect")) {
        return handle_introspect(msg, path);
    }

    if (!has_path(path)) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    D_LOG_D(logger_, "method call received: " << *msg);

    const ServerMethod* method = nullptr;
    if (intf_name) {
        const ServerInterface* intf = find_interface(path, intf_name);
        if (!intf) {
            send_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE,
                    std::string{"no interface "} + intf_name + " at " + path);
            return DBUS_HANDLER_RESULT_HANDLED;
        }
        method = intf->find_method(member);
    } else {
        for (auto& reg: registrations_) {
            if (reg.path == path && (method = reg.intf->find_method(member))) {
                break;
            }
        }
    }

    if (!method) {
        send_error(msg, DBUS_ERROR_UNKNOWN_METHOD, std::string{"no method "} + member + " at " + path);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    const char* signature = dbus_message_get_signature(msg);
    if (method->descriptor->input_signature() != signature) {
        send_error(msg, DBUS_ERROR_INVALID_ARGS, std::string{"expected signature \""}
                + method->descriptor->input_signature() + "\" but got \"" + signature + "\"");
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    ValueList args;
    RichStatus status = unpack_message(msg, &args);
    if (status.is_error()) {
        send_error(msg, DBUS_ERROR_INVALID_ARGS, status.message());
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    PendingReply* ctx = new PendingReply{this, msg, method->descriptor->result_signature()};
    dbus_message_ref(msg);
    pending_replies_.insert(ctx);
    method->on_call.invoke(args, MEMBER_CB(ctx, on_reply));

    return DBUS_HANDLER_RESULT_HANDLED;
}

void LibDBusBus::PendingReply::on_reply(RichStatus status, Value value) {
    if (parent) {
        parent->pending_replies_.erase(this);

        if (status.is_error()) {
            D_LOG_W(parent->logger_, "method call " << *call << " failed: " << status);
        }

        if (!dbus_message_get_no_reply(call)) {
            if (status.is_error()) {
                parent->send_error(call, status);
            } else {
                parent->send_reply(call, result_signature, value_to_payload(value, result_signature));
            }
        }
    }

    dbus_message_unref(call);
    delete this;
}

DBusHandlerResult LibDBusBus::handle_properties_call(DBusMessage* msg, const char* path, const char* member) {
    if (!has_path(path)) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    D_LOG_D(logger_, "property call received: " << *msg);

    std::string signature = dbus_message_get_signature(msg);
    ValueList args;
    RichStatus status = unpack_message(msg, &args);
    if (status.is_error()) {
        send_error(msg, DBUS_ERROR_INVALID_ARGS, status.message());
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (!strcmp(member, "Get") && signature == "ss") {
        const std::string& intf_name = *args[0].get_if<std::string>();
        const std::string& name = *args[1].get_if<std::string>();

        const ServerInterface* intf = nullptr;
        const ServerProperty* property = find_property(path, intf_name, name, &intf);
        if (!property) {
            send_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "no property " + intf_name + "." + name);
            return DBUS_HANDLER_RESULT_HANDLED;
        }

        Value value;
        status = property->on_get.invoke(&value);
        if (status.is_error()) {
            send_error(msg, status);
        } else {
            send_reply(msg, DBUS_TYPE_VARIANT_AS_STRING, {Value{Variant{property->descriptor->signature(), value}}});
        }

    } else if (!strcmp(member, "Set") && signature == "ssv") {
        const std::string& intf_name = *args[0].get_if<std::string>();
        const std::string& name = *args[1].get_if<std::string>();
        const Variant& var = *args[2].get_if<Variant>();

        const ServerInterface* intf = nullptr;
        const ServerProperty* property = find_property(path, intf_name, name, &intf);
        if (!property) {
            send_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "no property " + intf_name + "." + name);
            return DBUS_HANDLER_RESULT_HANDLED;
        }
        if (!property->on_set) {
            send_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "property " + name + " is read-only");
            return DBUS_HANDLER_RESULT_HANDLED;
        }
        if (!var.inner || var.signature != property->descriptor->signature()) {
            send_error(msg, DBUS_ERROR_INVALID_ARGS, "property " + name + " has type \""
                    + property->descriptor->signature() + "\" but got \"" + var.signature + "\"");
            return DBUS_HANDLER_RESULT_HANDLED;
        }

        status = property->on_set.invoke(*var.inner);
        if (status.is_error()) {
            send_error(msg, status);
        } else {
            send_reply(msg, "", {});
            emit_properties_changed(path, intf, property->descriptor, *var.inner);
        }

    } else if (!strcmp(member, "GetAll") && signature == "s") {
        const std::string& intf_name = *args[0].get_if<std::string>();
        const ServerInterface* intf = find_interface(path, intf_name);
        if (!intf) {
            send_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "no interface " + intf_name + " at " + path);
            return DBUS_HANDLER_RESULT_HANDLED;
        }

        Dict result;
        for (auto& property: intf->properties) {
            Value value;
            if (D_LOG_IF_ERR(logger_, property.on_get.invoke(&value), "failed to read " << property.descriptor->name())) {
                continue;
            }
            result.entries.push_back({Value{property.descriptor->name()},
                                      Value{Variant{property.descriptor->signature(), value}}});
        }
        send_reply(msg, "a{sv}", {Value{std::move(result)}});

    } else {
        send_error(msg, DBUS_ERROR_UNKNOWN_METHOD, std::string{"no method "} + member + " with signature \""
                + signature + "\" on " DBUS_INTERFACE_PROPERTIES);
    }

    return DBUS_HANDLER_RESULT_HANDLED;
}

void LibDBusBus::emit_properties_changed(const std::string& path, const ServerInterface* intf,
                                         const PropertyDescriptor* desc, const Value& value) {
    if (desc->flags() & (kPropertyConst | kPropertyNoEmit)) {
        return;
    }

    Dict changed;
    Array invalidated;
    if (desc->flags() & kPropertyEmitsInvalidation) {
        invalidated.elements.push_back(Value{desc->name()});
    } else {
        changed.entries.push_back({Value{desc->name()}, Value{Variant{desc->signature(), value}}});
    }

    SignalEmission signal{path, DBUS_INTERFACE_PROPERTIES, "PropertiesChanged", "sa{sv}as",
                          {Value{intf->name}, Value{std::move(changed)}, Value{std::move(invalidated)}}};
    D_LOG_IF_ERR(logger_, emit_signal(signal), "failed to emit PropertiesChanged");
}

DBusHandlerResult LibDBusBus::handle_introspect(DBusMessage* msg, const char* path) {
    std::vector<std::string> children = child_nodes(path);
    if (!has_path(path) && children.empty()) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    std::vector<ServerInterface> standard = describe_table(*common_interfaces(), true);
    std::vector<const ServerInterface*> interfaces;
    for (auto& intf: standard) {
        interfaces.push_back(&intf);
    }
    for (auto& reg: registrations_) {
        if (reg.path == path) {
            interfaces.push_back(reg.intf);
        }
    }

    send_reply(msg, DBUS_TYPE_STRING_AS_STRING, {Value{generate_introspection_xml(interfaces, children)}});
    return DBUS_HANDLER_RESULT_HANDLED;
}

void LibDBusBus::send_reply(DBusMessage* call, const std::string& signature, const ValueList& args) {
    DBusMessage* reply = dbus_message_new_method_return(call);
    if (!reply) {
        D_LOG_E(logger_, "reply msg NULL. Will not send reply.");
        return;
    }

    RichStatus status = pack_message(reply, signature, args);
    if (status.is_error()) {
        dbus_message_unref(reply);
        D_LOG_E(logger_, "failed to pack reply to " << *call << ": " << status);
        send_error(call, DBUS_ERROR_FAILED, "the method returned a value that does not match \"" + signature + "\"");
        return;
    }

    if (!dbus_connection_send(conn_, reply, nullptr)) {
        D_LOG_E(logger_, "failed to send reply");
    }
    dbus_message_unref(reply);
}

void LibDBusBus::send_error(DBusMessage* call, const char* error_name, const std::string& message) {
    DBusMessage* reply = dbus_message_new_error(call, error_name, message.c_str());
    if (!reply) {
        D_LOG_E(logger_, "error msg NULL. Will not send error.");
        return;
    }
    if (!dbus_connection_send(conn_, reply, nullptr)) {
        D_LOG_E(logger_, "failed to send error");
    }
    dbus_message_unref(reply);
}

void LibDBusBus::send_error(DBusMessage* call, const RichStatus& status) {
    std::string error_name = status.error_name();
    if (error_name.empty() || !is_valid_error_name(error_name)) {
        bool bad_args = status.code() == Status::kInvalidArgument || status.code() == Status::kArgumentError;
        error_name = bad_args ? DBUS_ERROR_INVALID_ARGS : DBUS_ERROR_FAILED;
    }
    std::string message = status.message();
    send_error(call, error_name.c_str(), message.empty() ? status_to_string(status.code()) : message);
}

/* Default bus ---------------------------------------------------------------*/

RichStatus dbind::get_default_bus(EventLoop* event_loop, Logger logger, Bus** p_bus) {
    // Lives until the process exits
    static LibDBusBus* default_bus = nullptr;

    if (!default_bus) {
        const char* var = std::getenv("DBIND_BUS");
        DBusBusType type = DBUS_BUS_SESSION;
        if (var && !strcmp(var, "system")) {
            type = DBUS_BUS_SYSTEM;
        } else if (var && strcmp(var, "session")) {
            return D_MAKE_ERR_CODE(Status::kInvalidArgument, "DBIND_BUS must be \"session\" or \"system\", not \"" << var << "\"");
        }

        LibDBusBus* bus = new LibDBusBus();
        RichStatus status = bus->open(event_loop, logger, type);
        if (status.is_error()) {
            delete bus;
            return D_AMEND_ERR(status, "failed to open the default bus");
        }
        default_bus = bus;
    }

    if (p_bus) {
        *p_bus = default_bus;
    }
    return RichStatus::success();
}
