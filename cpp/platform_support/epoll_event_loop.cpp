#include <dbind/config.hpp>

#if DBIND_ENABLE_EVENT_LOOP

#include "epoll_event_loop.hpp"
#include <dbind/rich_status.hpp>
#include <sys/epoll.h>
#include <sys/types.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <string.h>
#include <exception>

using namespace dbind;

RichStatus EpollEventLoop::start(Logger logger, Callback<void> on_started) {
    D_RET_IF(epoll_fd_ >= 0, "already started");

    epoll_fd_ = epoll_create1(0);
    D_RET_IF(epoll_fd_ < 0, "epoll_create1() failed" << sys_err{});
    logger_ = logger;
    stop_requested_ = false;

    RichStatus status = RichStatus::success();

    post_fd_ = eventfd(0, 0);

    if (post_fd_ < 0) {
        status = D_MAKE_ERR("failed to create an event for posting callbacks onto the event loop");
        goto done0;
    }

    if ((status = register_event(post_fd_, EPOLLIN, MEMBER_CB(this, run_callbacks))).is_error()) {
        status = D_AMEND_ERR(status, "failed to register event");
        goto done1;
    }

    if ((status = post(on_started)).is_error()) {
        status = D_AMEND_ERR(status, "post() failed");
        goto done2;
    }

    // Run for as long as there are callbacks pending posted or there's at least
    // one file descriptor other than post_fd_ registerd.
    while (!stop_requested_ && (pending_callbacks_.size() || (context_map_.size() > 1))) {
        iterations_++;

        do {
            D_LOG_T(logger, "epoll_wait...");
            n_triggered_events_ = epoll_wait(epoll_fd_, triggered_events_, max_triggered_events_, -1);
            D_LOG_T(logger, "epoll_wait unblocked by " << n_triggered_events_ << " events");
        } while (n_triggered_events_ < 0 && errno == EINTR); // ignore syscall interruptions. This happens for instance during suspend.

        if (n_triggered_events_ <= 0) {
            status = D_MAKE_ERR("epoll_wait() failed with " << n_triggered_events_ << ": " << sys_err() << " - Terminating event loop.");
            break;
        }

        for (int i = 0; i < n_triggered_events_; ++i) {
            EventContext* ctx = (EventContext*)triggered_events_[i].data.ptr;
            if (ctx) {
                try {
                    ctx->callback.invoke(triggered_events_[i].events);
                } catch (const std::exception& ex) {
                    D_LOG_E(logger, "event callback threw an exception: " << ex.what());
                }
            }
        }
        n_triggered_events_ = 0;
    }

    D_LOG_D(logger, "epoll loop exited");

done2:
    if (deregister_event(post_fd_).is_error()) {
        status = D_MAKE_ERR("deregister_event() failed");
    }

done1:
    if (close(post_fd_) != 0) {
        status = D_AMEND_ERR(status, "close() failed: " << sys_err());
    }
    post_fd_ = -1;

done0:
    if (close(epoll_fd_) != 0) {
        status = D_AMEND_ERR(status, "close() failed: " << sys_err());
    }
    epoll_fd_ = -1;

    return status;
}

RichStatus EpollEventLoop::stop() {
    D_RET_IF(epoll_fd_ < 0, "not started");
    stop_requested_ = true;
    return RichStatus::success();
}

RichStatus EpollEventLoop::post(Callback<void> callback) {
    D_RET_IF(epoll_fd_ < 0, "not started");

    {
        std::unique_lock<std::mutex> lock(pending_callbacks_mutex_);
        pending_callbacks_.push_back(callback);
    }

    const uint64_t val = 1;
    D_RET_IF(write(post_fd_, &val, sizeof(val)) != sizeof(val),
             "write() failed: " << sys_err());
    return RichStatus::success();
}

RichStatus EpollEventLoop::register_event(int event_fd, uint32_t events, Callback<void, uint32_t> callback) {
    D_RET_IF(epoll_fd_ < 0, "not initialized");
    D_RET_IF(event_fd < 0, "invalid argument");
    D_RET_IF(context_map_.count(event_fd), "fd " << event_fd << " already registered");

    EventContext* ctx = new EventContext{callback};
    struct epoll_event ev = {};
    ev.events = events;
    ev.data.ptr = ctx;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, event_fd, &ev) != 0) {
        delete ctx;
        return D_MAKE_ERR("epoll_ctl(" << event_fd << "...) failed: " << sys_err());
    }
    context_map_[event_fd] = ctx;

    D_LOG_T(logger_, "registered epoll event " << event_fd);

    return RichStatus::success();
}

RichStatus EpollEventLoop::modify_event(int event_fd, uint32_t events) {
    D_RET_IF(epoll_fd_ < 0, "not initialized");
    auto it = context_map_.find(event_fd);
    D_RET_IF(it == context_map_.end(), "event context not found");

    struct epoll_event ev = {};
    ev.events = events;
    ev.data.ptr = it->second;
    D_RET_IF(epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, event_fd, &ev) != 0,
             "epoll_ctl(" << event_fd << "...) failed: " << sys_err());
    return RichStatus::success();
}

void EpollEventLoop::drop_events(EventContext* ctx) {
    for (int i = 0; i < n_triggered_events_; ++i) {
        if ((EventContext*)(triggered_events_[i].data.ptr) == ctx) {
            triggered_events_[i].data.ptr = nullptr;
        }
    }
}

RichStatus EpollEventLoop::deregister_event(int event_fd) {
    D_RET_IF(epoll_fd_ < 0, "not initialized");

    RichStatus status = RichStatus::success();

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, event_fd, nullptr) != 0) {
        status = D_MAKE_ERR("epoll_ctl() failed: " << sys_err());
    }

    auto it = context_map_.find(event_fd);
    D_RET_IF(it == context_map_.end(), "event context not found");
    drop_events(it->second);
    delete it->second;
    context_map_.erase(it);

    return status;
}

RichStatus EpollEventLoop::open_timer(Timer** p_timer, Callback<void> on_trigger) {
    if (p_timer) {
        *p_timer = nullptr;
    }

    int fd = timerfd_create(CLOCK_MONOTONIC, 0);
    D_RET_IF(fd < 0, "timerfd_create() failed: " << sys_err{});

    TimerContext* timer = new TimerContext{}; // deleted in close_timer()
    timer->parent = this;
    timer->fd = fd;
    timer->callback = on_trigger;

    RichStatus status;

    if ((status = register_event(fd, EPOLLIN, MEMBER_CB(timer, on_timer))).is_error()) {
        goto fail;
    }

    if (p_timer) {
        *p_timer = timer;
    }
    return RichStatus::success();

fail:
    close(fd);
    delete timer;
    return status;
}

RichStatus EpollEventLoop::TimerContext::set(float interval, TimerMode mode) {
    struct itimerspec timerspec = {};

    if (mode != TimerMode::kNever) {
        timerspec.it_value.tv_sec = (long)interval;
        timerspec.it_value.tv_nsec = (long)((interval - (float)(long)interval) * 1e9f);
        if (timerspec.it_value.tv_sec == 0 && timerspec.it_value.tv_nsec == 0) {
            timerspec.it_value.tv_nsec = 1; // a zero value would disarm the timer
        }
        if (mode == TimerMode::kPeriodic) {
            timerspec.it_interval = timerspec.it_value;
        }
    }

    auto it = parent->context_map_.find(fd);
    if (it != parent->context_map_.end()) {
        parent->drop_events(it->second);
    }

    if (timerfd_settime(fd, 0, &timerspec, nullptr) != 0) {
        return D_MAKE_ERR("timerfd_settime() failed: " << sys_err{});
    }

    return RichStatus::success();
}

void EpollEventLoop::TimerContext::on_timer(uint32_t mask) {
    if (mask & EPOLLIN) {
        uint64_t n_triggers;
        if (read(fd, (uint8_t*)&n_triggers, sizeof(n_triggers)) == -1) {
            D_LOG_E(parent->logger_, "failed to read timer: " << sys_err{});
            return;
        }

        callback.invoke();
    }

    if (mask & ~(EPOLLIN)) {
        D_LOG_E(parent->logger_, "unexpected event " << mask);
        return;
    }
}

RichStatus EpollEventLoop::close_timer(Timer* timer) {
    TimerContext* ctx = static_cast<TimerContext*>(timer);
    RichStatus status = deregister_event(ctx->fd);
    close(ctx->fd);
    delete ctx;
    return status;
}

void EpollEventLoop::run_callbacks(uint32_t) {
    uint64_t val;
    D_LOG_IF(logger_, read(post_fd_, &val, sizeof(val)) != sizeof(val),
             "failed to read from post file descriptor");

    std::vector<Callback<void>> pending_callbacks;

    {
        std::unique_lock<std::mutex> lock(pending_callbacks_mutex_);
        std::swap(pending_callbacks, pending_callbacks_);
    }

    for (auto& cb: pending_callbacks) {
        cb.invoke();
    }
}

#endif
