#pragma once

/**
 * TtlCache.hpp
 *
 * Two-tier key/value cache with expiry and an entry-count bound.
 * Memory is consulted first, the durable store second.
 */

#include "../Logger.hpp"
#include "../storage/DurableStore.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace harbor::core::cache {

/**
 * Cache options
 */
struct TtlCacheOptions {
    // Lifetime of an entry when set() is called without an explicit ttl
    std::chrono::milliseconds ttl{std::chrono::minutes(5)};

    // Upper bound on in-memory entries; the oldest writes go first
    size_t maxEntries{50};

    // Prepended to every key in the durable store
    std::string keyPrefix{"cache."};
};

/**
 * Cached value with its write time and lifetime
 */
template<typename T>
struct CacheEntry {
    T value;
    std::chrono::system_clock::time_point storedAt;
    std::chrono::milliseconds ttl{0};
    uint64_t sequence{0};

    bool isValid(std::chrono::system_clock::time_point now) const {
        return now - storedAt < ttl;
    }
};

/**
 * TtlCache - expiring cache over a DurableStore
 *
 * Features:
 * - get() falls back to durable storage and re-populates memory on a hit
 * - set() writes memory synchronously; the durable write is best-effort
 * - Expired entries are purged after every set(), then the oldest
 *   entries are evicted until maxEntries holds
 * - Expired and evicted entries are removed from both tiers
 *
 * T must be convertible to and from nlohmann::json.
 */
template<typename T>
class TtlCache {
public:
    using Clock = std::chrono::system_clock;

    explicit TtlCache(std::shared_ptr<storage::DurableStore> store,
                      TtlCacheOptions options = {})
        : m_store(std::move(store))
        , m_options(std::move(options)) {
        if (m_options.maxEntries == 0) {
            m_options.maxEntries = 1;
        }
    }

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    /**
     * Look up a value
     * @param key Cache key
     * @return The value if present and not expired
     */
    std::optional<T> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = Clock::now();

        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            if (it->second.isValid(now)) {
                ++m_hitCount;
                return it->second.value;
            }
            m_entries.erase(it);
        }

        auto durable = readDurable(key, now);
        if (!durable) {
            ++m_missCount;
            return std::nullopt;
        }

        T value = durable->value;
        durable->sequence = ++m_sequence;
        m_entries[key] = std::move(*durable);
        purgeLocked(now);
        ++m_hitCount;
        return value;
    }

    /**
     * Store a value
     * @param key Cache key
     * @param value Value to cache
     * @param ttl Lifetime (defaults to the cache-wide ttl)
     */
    void set(const std::string& key, const T& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = Clock::now();

        CacheEntry<T> entry{value, now, ttl.value_or(m_options.ttl), ++m_sequence};
        writeDurable(key, entry);
        m_entries[key] = std::move(entry);

        purgeLocked(now);
    }

    /**
     * Remove a key from both tiers
     */
    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.erase(key);
        removeDurable(key);
    }

    /**
     * Drop every entry, including durable entries written by earlier runs
     */
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();

        if (!m_store) return;
        for (const auto& storeKey : m_store->keys()) {
            if (storeKey.compare(0, m_options.keyPrefix.size(), m_options.keyPrefix) == 0) {
                m_store->remove(storeKey);
            }
        }
    }

    /**
     * Number of entries held in memory
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    size_t hitCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_hitCount;
    }

    size_t missCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_missCount;
    }

    const TtlCacheOptions& options() const { return m_options; }

private:
    std::string storeKey(const std::string& key) const {
        return m_options.keyPrefix + key;
    }

    void purgeLocked(Clock::time_point now) {
        for (auto it = m_entries.begin(); it != m_entries.end(); ) {
            if (!it->second.isValid(now)) {
                removeDurable(it->first);
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }

        if (m_entries.size() <= m_options.maxEntries) {
            return;
        }

        std::vector<std::pair<std::string, std::pair<Clock::time_point, uint64_t>>> order;
        order.reserve(m_entries.size());
        for (const auto& [key, entry] : m_entries) {
            order.push_back({key, {entry.storedAt, entry.sequence}});
        }
        std::sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
            return a.second < b.second;
        });

        size_t excess = m_entries.size() - m_options.maxEntries;
        for (size_t i = 0; i < excess; ++i) {
            Logger::instance().trace("Cache evicting {}", order[i].first);
            m_entries.erase(order[i].first);
            removeDurable(order[i].first);
        }
    }

    std::optional<CacheEntry<T>> readDurable(const std::string& key, Clock::time_point now) {
        if (!m_store) return std::nullopt;

        auto bytes = m_store->read(storeKey(key));
        if (!bytes) return std::nullopt;

        try {
            auto j = nlohmann::json::parse(*bytes);

            CacheEntry<T> entry{
                j.at("data").template get<T>(),
                Clock::time_point(std::chrono::milliseconds(j.at("timestamp").template get<int64_t>())),
                std::chrono::milliseconds(j.at("ttl").template get<int64_t>()),
                0
            };

            if (entry.isValid(now)) {
                return entry;
            }
        } catch (const nlohmann::json::exception& e) {
            Logger::instance().warn("Discarding unreadable cache entry '{}': {}", key, e.what());
        }

        removeDurable(key);
        return std::nullopt;
    }

    void writeDurable(const std::string& key, const CacheEntry<T>& entry) {
        if (!m_store) return;

        try {
            auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.storedAt.time_since_epoch()).count();
            nlohmann::json j = {
                {"data", entry.value},
                {"timestamp", timestamp},
                {"ttl", entry.ttl.count()}
            };
            if (!m_store->write(storeKey(key), j.dump())) {
                Logger::instance().warn("Cache set error: durable write failed for '{}'", key);
            }
        } catch (const std::exception& e) {
            Logger::instance().warn("Cache set error for '{}': {}", key, e.what());
        }
    }

    void removeDurable(const std::string& key) {
        if (!m_store) return;
        m_store->remove(storeKey(key));
    }

private:
    std::shared_ptr<storage::DurableStore> m_store;
    TtlCacheOptions m_options;

    std::unordered_map<std::string, CacheEntry<T>> m_entries;
    mutable std::mutex m_mutex;

    uint64_t m_sequence{0};
    size_t m_hitCount{0};
    size_t m_missCount{0};
};

} // namespace harbor::core::cache
