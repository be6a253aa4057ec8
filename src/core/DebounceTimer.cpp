/**
 * DebounceTimer.cpp
 */

#include "DebounceTimer.hpp"
#include "Logger.hpp"

namespace harbor::core {

DebounceTimer::DebounceTimer() {
    m_thread = std::thread([this] { run(); });
}

DebounceTimer::~DebounceTimer() {
    stop();
}

bool DebounceTimer::schedule(std::chrono::milliseconds delay, std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return false;
        }
        m_callback = std::move(callback);
        m_deadline = std::chrono::steady_clock::now() + delay;
        m_pending = true;
    }
    m_condition.notify_all();
    return true;
}

bool DebounceTimer::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool wasPending = m_pending;
    m_pending = false;
    m_callback = nullptr;
    m_condition.notify_all();
    return wasPending;
}

bool DebounceTimer::isPending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

void DebounceTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        m_pending = false;
        m_callback = nullptr;
    }
    m_condition.notify_all();

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

void DebounceTimer::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (!m_pending) {
            m_condition.wait(lock, [this] { return m_pending || !m_running; });
            continue;
        }

        auto deadline = m_deadline;
        if (std::chrono::steady_clock::now() < deadline) {
            // Woken early by a reschedule, a cancel or stop: re-evaluate
            m_condition.wait_until(lock, deadline);
            continue;
        }

        auto callback = std::move(m_callback);
        m_callback = nullptr;
        m_pending = false;

        lock.unlock();
        try {
            if (callback) {
                callback();
            }
        } catch (const std::exception& e) {
            Logger::instance().error("Debounced callback failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace harbor::core
