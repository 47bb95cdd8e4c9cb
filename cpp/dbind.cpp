#include <dbind/dbind.hpp>

#if DBIND_ENABLE_TEXT_LOGGING
#include <chrono>
#include <ctime>
#include <iostream>
#endif

#if DBIND_ENABLE_EVENT_LOOP
#  ifdef __linux__
#    include "platform_support/epoll_event_loop.hpp"
using EventLoopImpl = dbind::EpollEventLoop;
#  else
#    error "No event loop implementation available for this operating system."
#  endif
#endif

using namespace dbind;

RichStatus dbind::launch_event_loop(Logger logger, Callback<void, EventLoop*> on_started) {
#if DBIND_ENABLE_EVENT_LOOP
    EventLoopImpl event_loop;
    auto start = [&]() { on_started.invoke(&event_loop); };
    return event_loop.start(logger, start);
#else
    return D_MAKE_ERR("event loop support not enabled");
#endif
}

#if DBIND_ENABLE_TEXT_LOGGING
static std::string get_local_time() {
    auto now(std::chrono::system_clock::now());
    auto seconds_since_epoch(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()));

    // Construct time_t using 'seconds_since_epoch' rather than 'now' since it is
    // implementation-defined whether the value is rounded or truncated.
    std::time_t now_t(
        std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::time_point(seconds_since_epoch)));

    char temp[10];
    if (!std::strftime(temp, 10, "%H:%M:%S.", std::localtime(&now_t))) {
        return "";
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch() - seconds_since_epoch).count();
    std::string frac = std::to_string(millis);
    return std::string(temp) + std::string(3 - std::min<size_t>(3, frac.size()), '0') + frac;
}

void dbind::log_to_stderr(void* ctx, const char* file, unsigned line, int level, uintptr_t info0, uintptr_t info1, const char* text) {
    switch ((LogLevel)level) {
    case LogLevel::kWarning:
        std::cerr << "\x1b[93;1m"; // yellow
        break;
    case LogLevel::kError:
        std::cerr << "\x1b[91;1m"; // red
        break;
    default:
        break;
    }
    std::cerr << get_local_time() << " [" << file << ":" << line << "] " << text << "\x1b[0m" << std::endl;
}
#else
void dbind::log_to_stderr(void* ctx, const char* file, unsigned line, int level, uintptr_t info0, uintptr_t info1, const char* text) {
    // ignore
}
#endif
