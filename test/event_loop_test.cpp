#include <dbind/dbind.hpp>
#include "test_utils.hpp"

#include <chrono>

using namespace dbind;

/**
 * @brief Counts timer triggers and closes the timer after a fixed number.
 */
struct TimerTest {
    EventLoop* event_loop = nullptr;
    Timer* timer = nullptr;
    size_t n_triggers = 0;
    size_t max_triggers = 10;
    RichStatus open_status = RichStatus::success();
    RichStatus close_status = RichStatus::success();

    void on_started(EventLoop* loop) {
        event_loop = loop;
        open_status = loop->open_timer(&timer, MEMBER_CB(this, on_trigger));
        if (open_status.is_success()) {
            open_status = timer->set(0.01f, TimerMode::kPeriodic);
        }
    }

    void on_trigger() {
        if (++n_triggers == max_triggers) {
            close_status = event_loop->close_timer(timer);
            timer = nullptr;
        }
    }
};

TestContext timer_test() {
    TestContext context;
    TimerTest test;
    Logger logger{{log_to_stderr, nullptr}, get_log_verbosity()};

    auto start_time = std::chrono::steady_clock::now();

    // The loop returns once the timer is closed
    TEST_OK(launch_event_loop(logger, MEMBER_CB(&test, on_started)));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    TEST_OK(test.open_status);
    TEST_OK(test.close_status);
    TEST_EQUAL(test.n_triggers, (size_t)10);
    TEST_ASSERT(elapsed >= 90);
    TEST_ASSERT(elapsed < 2000);

    return context;
}

/**
 * @brief Posts a chain of callbacks, each one from within the previous one.
 */
struct PostTest {
    EventLoop* event_loop = nullptr;
    size_t n_runs = 0;
    RichStatus post_status = RichStatus::success();

    void on_started(EventLoop* loop) {
        event_loop = loop;
        on_posted();
    }

    void on_posted() {
        if (++n_runs < 5) {
            RichStatus status = event_loop->post(MEMBER_CB(this, on_posted));
            if (status.is_error()) {
                post_status = status;
            }
        }
    }
};

TestContext post_test() {
    TestContext context;
    PostTest test;

    TEST_OK(launch_event_loop(Logger::none(), MEMBER_CB(&test, on_started)));
    TEST_OK(test.post_status);
    TEST_EQUAL(test.n_runs, (size_t)5);

    return context;
}

int main() {
    TestContext context;

    TEST_ADD(timer_test());
    TEST_ADD(post_test());

    return context.summarize();
}
