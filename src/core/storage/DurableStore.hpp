#pragma once

/**
 * DurableStore.hpp
 *
 * Key-value storage that survives restarts. Shared by the TTL cache and
 * the persistence gateway.
 */

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor::core::storage {

/**
 * DurableStore - abstract byte store
 *
 * Implementations report failure through return values and never throw.
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    /**
     * Read a value
     * @param key Store key
     * @return Stored bytes, or std::nullopt if absent or unreadable
     */
    virtual std::optional<std::string> read(const std::string& key) const = 0;

    /**
     * Write a value, replacing any previous one
     * @return true if the value is durable
     */
    virtual bool write(const std::string& key, const std::string& bytes) = 0;

    /**
     * Remove a value
     * @return true if the key existed and was removed
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * List every key currently stored
     */
    virtual std::vector<std::string> keys() const = 0;
};

/**
 * MemoryStore - process-local store
 */
class MemoryStore : public DurableStore {
public:
    std::optional<std::string> read(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_values.find(key);
        if (it == m_values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool write(const std::string& key, const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values[key] = bytes;
        return true;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values.erase(key) > 0;
    }

    std::vector<std::string> keys() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> result;
        result.reserve(m_values.size());
        for (const auto& [key, value] : m_values) {
            result.push_back(key);
        }
        return result;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
};

} // namespace harbor::core::storage
