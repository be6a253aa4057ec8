/**
 * JsonUtils.cpp
 */

#include "JsonUtils.hpp"

namespace harbor::utils {

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return defaultValue;
}

uint64_t JsonUtils::getUnsigned(const json& j, const std::string& key, uint64_t defaultValue) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_number()) return defaultValue;
    if (j[key].is_number_float()) {
        double value = j[key].get<double>();
        return value > 0.0 ? static_cast<uint64_t>(value) : 0;
    }
    if (j[key].is_number_integer() && !j[key].is_number_unsigned()) {
        int64_t value = j[key].get<int64_t>();
        return value > 0 ? static_cast<uint64_t>(value) : 0;
    }
    return j[key].get<uint64_t>();
}

double JsonUtils::getDouble(const json& j, const std::string& key, double defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return defaultValue;
}

bool JsonUtils::getBool(const json& j, const std::string& key, bool defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return defaultValue;
}

std::optional<std::string> JsonUtils::getOptionalString(const json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::string JsonUtils::getStringAny(const json& j, std::initializer_list<const char*> keys,
                                    const std::string& defaultValue) {
    for (const char* key : keys) {
        if (j.is_object() && j.contains(key) && j[key].is_string()) {
            return j[key].get<std::string>();
        }
    }
    return defaultValue;
}

} // namespace harbor::utils
