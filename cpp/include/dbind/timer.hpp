#ifndef __DBIND_TIMER_HPP
#define __DBIND_TIMER_HPP

#include <dbind/callback.hpp>

namespace dbind {

struct RichStatus;

enum class TimerMode {
    kNever,
    kOnce,
    kPeriodic,
};

class Timer {
public:
    /**
     * @brief Sets the timer state.
     *
     * This can be called at any time while the timer is open, regardless
     * whether it is running or stopped.
     *
     * @param interval: The delay in seconds from now when the timer should
     *        fire the next time. For periodic timers this also sets the
     *        interval between subsequent triggers. Ignored for
     *        TimerMode::kNever.
     * @param mode: kOnce fires a single time, kPeriodic fires repeatedly,
     *        kNever stops the timer.
     */
    virtual RichStatus set(float interval, TimerMode mode) = 0;
};

class TimerProvider {
public:
    /**
     * @brief Opens a new timer.
     *
     * The timer starts in stopped state.
     *
     * @param on_trigger: The callback that will be called whenever the timer
     *        fires.
     */
    virtual RichStatus open_timer(Timer** p_timer, Callback<void> on_trigger) = 0;

    /**
     * @brief Closes the specified timer.
     *
     * The associated callback will not be called again after (nor during) this
     * function.
     */
    virtual RichStatus close_timer(Timer* timer) = 0;
};

}

#endif // __DBIND_TIMER_HPP
