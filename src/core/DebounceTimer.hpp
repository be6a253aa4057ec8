#pragma once

/**
 * DebounceTimer.hpp
 *
 * Single-slot timer: scheduling again before the deadline replaces the
 * pending callback and pushes the deadline out.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace harbor::core {

class DebounceTimer {
public:
    DebounceTimer();
    ~DebounceTimer();

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    /**
     * Arm the timer
     * @param delay Time from now until the callback runs
     * @param callback Replaces any callback still pending
     * @return false once the timer has been stopped
     */
    bool schedule(std::chrono::milliseconds delay, std::function<void()> callback);

    /**
     * Drop the pending callback, if any
     * @return true if a callback was pending
     */
    bool cancel();

    bool isPending() const;

    /**
     * Cancel the pending callback and join the timer thread.
     * A callback already running is waited for.
     */
    void stop();

private:
    void run();

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::thread m_thread;

    std::function<void()> m_callback;
    std::chrono::steady_clock::time_point m_deadline;
    bool m_pending{false};
    bool m_running{true};
};

} // namespace harbor::core
