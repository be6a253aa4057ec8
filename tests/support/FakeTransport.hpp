#pragma once

/**
 * FakeTransport.hpp
 *
 * Scripted NetworkTransport for tests. A held fetch keeps polling the
 * observer's progress hook until the URL is released, so pause blocks it
 * and abort ends it like a real transfer.
 */

#include "core/downloader/NetworkTransport.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace harbor::test {

struct FakeScript {
    std::string body{"payload-bytes"};
    bool fail{false};
    std::string error{"connection reset"};

    // Block until release(url)
    bool hold{false};

    // The first N fetches of the URL block until release(url) without
    // calling back, like a transport stuck in a read
    size_t stallFetches{0};

    // Reported by probeSize()
    std::optional<uint64_t> size;
};

class FakeTransport : public core::downloader::NetworkTransport {
public:
    void script(const std::string& url, FakeScript script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[url] = std::move(script);
    }

    void release(const std::string& url) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released.insert(url);
    }

    bool waitStarted(const std::string& url,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, timeout, [&] { return m_started.count(url) > 0; });
    }

    size_t fetchCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_started.find(url);
        return it == m_started.end() ? 0 : it->second;
    }

    size_t inFlight() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inFlight;
    }

    size_t maxInFlight() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxInFlight;
    }

    core::downloader::TransportResult fetch(const std::string& url,
                                            core::downloader::TransportObserver& observer) override {
        FakeScript script;
        size_t ordinal = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_scripts.find(url);
            if (it != m_scripts.end()) {
                script = it->second;
            }
            ordinal = ++m_started[url];
            ++m_inFlight;
            m_maxInFlight = std::max(m_maxInFlight, m_inFlight);
        }
        m_condition.notify_all();

        while (ordinal <= script.stallFetches && !isReleased(url)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        auto result = perform(url, script, observer);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
        }
        return result;
    }

    std::optional<uint64_t> probeSize(const std::string& url) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_scripts.find(url);
        return it == m_scripts.end() ? std::nullopt : it->second.size;
    }

private:
    core::downloader::TransportResult perform(const std::string& url, const FakeScript& script,
                                              core::downloader::TransportObserver& observer) {
        core::downloader::TransportResult result;
        const uint64_t total = script.body.size();

        while (script.hold && !isReleased(url)) {
            if (!observer.onProgress(0, total)) {
                result.aborted = true;
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        if (script.fail) {
            result.error = script.error;
            return result;
        }

        constexpr size_t kChunk = 4;
        uint64_t sent = 0;
        while (sent < total) {
            size_t n = std::min<uint64_t>(kChunk, total - sent);
            if (!observer.onData(script.body.data() + sent, n)) {
                result.aborted = true;
                return result;
            }
            sent += n;
            if (!observer.onProgress(sent, total)) {
                result.aborted = true;
                return result;
            }
        }

        result.success = true;
        result.statusCode = 200;
        return result;
    }

    bool isReleased(const std::string& url) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_released.count(url) > 0;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::map<std::string, FakeScript> m_scripts;
    std::set<std::string> m_released;
    std::map<std::string, size_t> m_started;
    size_t m_inFlight{0};
    size_t m_maxInFlight{0};
};

} // namespace harbor::test
