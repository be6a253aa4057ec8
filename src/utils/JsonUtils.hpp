// Harbor - JSON Utilities
// Lenient accessors for records read back from disk

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace harbor::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 *
 * Accessors return the default when the key is missing or has the
 * wrong type, so partially-populated records load instead of throwing.
 */
class JsonUtils {
public:
    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static uint64_t getUnsigned(const json& j, const std::string& key, uint64_t defaultValue = 0);
    static double getDouble(const json& j, const std::string& key, double defaultValue = 0.0);
    static bool getBool(const json& j, const std::string& key, bool defaultValue = false);
    static std::optional<std::string> getOptionalString(const json& j, const std::string& key);

    // First key present wins; used to read renamed fields
    static std::string getStringAny(const json& j, std::initializer_list<const char*> keys,
                                    const std::string& defaultValue = "");
};

} // namespace harbor::utils
