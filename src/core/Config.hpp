#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace harbor::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds the application settings. Components do not read it directly;
 * the Application translates it into option structs at startup.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Set default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"downloads", {
                {"maxConcurrent", 2},
                {"directory", ""},
                {"connectTimeoutMs", 10000},
                {"lowSpeedLimit", 1},
                {"lowSpeedTimeSeconds", 60},
                {"userAgent", "Harbor/1.0"}
            }},
            {"storage", {
                {"directory", ""}
            }},
            {"persistence", {
                {"debounceMs", 1000},
                {"key", "downloads"}
            }},
            {"cache", {
                {"ttlSeconds", 300},
                {"maxEntries", 50}
            }},
            {"gallery", {
                {"enabled", false},
                {"directory", ""}
            }},
            {"log", {
                {"level", "info"}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     * @return false if the key path is malformed
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            return m_config.contains(ptr);
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Remove configuration key
     * @param key Key path
     */
    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (!m_config.contains(ptr)) {
                return;
            }

            json::json_pointer parent = ptr.parent_pointer();
            std::string leafKey = ptr.back();

            if (parent.empty()) {
                m_config.erase(leafKey);
            } else if (m_config.contains(parent)) {
                m_config.at(parent).erase(leafKey);
            }
        } catch (const json::exception&) {
            // Key doesn't exist or invalid path
        }
    }

    /**
     * Get entire configuration as JSON
     */
    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    /**
     * Merge configuration values
     * @param other JSON object to merge
     */
    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace harbor::core
