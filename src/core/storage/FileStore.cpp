/**
 * FileStore.cpp
 */

#include "FileStore.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

namespace harbor::core::storage {

namespace fs = std::filesystem;

namespace {

constexpr const char* kValueExtension = ".val";

// Holds the full key next to a value stored under a hashed name
constexpr const char* kKeyExtension = ".key";

// Hashed names start with a character encodeKey() never emits
constexpr char kHashedPrefix = '~';

// Leaves room for the extensions within NAME_MAX (255)
constexpr size_t kMaxEncodedName = 200;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

FileStore::FileStore(fs::path root)
    : m_root(std::move(root)) {
    std::error_code ec;
    fs::create_directories(m_root, ec);
    if (ec) {
        Logger::instance().warn("Cannot create store directory {}: {}", m_root.string(), ec.message());
    }
}

std::string FileStore::encodeKey(const std::string& key) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

std::optional<std::string> FileStore::decodeKey(const std::string& fileName) {
    std::string decoded;
    decoded.reserve(fileName.size());
    for (size_t i = 0; i < fileName.size(); ++i) {
        if (fileName[i] != '%') {
            decoded += fileName[i];
            continue;
        }
        if (i + 2 >= fileName.size()) {
            return std::nullopt;
        }
        int hi = hexValue(fileName[i + 1]);
        int lo = hexValue(fileName[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return decoded;
}

std::string FileStore::fileNameFor(const std::string& key) {
    auto encoded = encodeKey(key);
    if (encoded.size() <= kMaxEncodedName) {
        return encoded;
    }

    auto digest = utils::HashUtils::sha256String(key);
    if (digest.empty()) {
        return {};
    }
    return kHashedPrefix + digest;
}

bool FileStore::isHashedName(const std::string& name) {
    return !name.empty() && name[0] == kHashedPrefix;
}

fs::path FileStore::valuePath(const std::string& name) const {
    return m_root / (name + kValueExtension);
}

fs::path FileStore::keyPath(const std::string& name) const {
    return m_root / (name + kKeyExtension);
}

std::optional<std::string> FileStore::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string data((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        Logger::instance().warn("Failed to read {}", path.string());
        return std::nullopt;
    }
    return data;
}

std::optional<std::string> FileStore::read(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto name = fileNameFor(key);
    if (name.empty()) {
        return std::nullopt;
    }

    // A hashed name only answers for the key recorded beside it
    if (isHashedName(name) && readFile(keyPath(name)) != key) {
        return std::nullopt;
    }
    return readFile(valuePath(name));
}

bool FileStore::write(const std::string& key, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto name = fileNameFor(key);
    if (name.empty()) {
        Logger::instance().warn("Store write for '{}' failed: cannot derive a file name", key);
        return false;
    }

    if (isHashedName(name) && !replaceFile(keyPath(name), key)) {
        return false;
    }
    return replaceFile(valuePath(name), bytes);
}

bool FileStore::replaceFile(const fs::path& path, const std::string& bytes) {
    auto tempPath = path;
    tempPath += ".tmp";

    try {
        fs::create_directories(path.parent_path());

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                Logger::instance().warn("Cannot open {} for writing", tempPath.string());
                return false;
            }
            file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            file.flush();
            if (!file) {
                Logger::instance().warn("Short write to {}", tempPath.string());
                std::error_code ec;
                fs::remove(tempPath, ec);
                return false;
            }
        }

        fs::rename(tempPath, path);
        return true;

    } catch (const fs::filesystem_error& e) {
        Logger::instance().warn("Store write to {} failed: {}", path.string(), e.what());
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }
}

bool FileStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto name = fileNameFor(key);
    if (name.empty()) {
        return false;
    }

    std::error_code ec;
    bool removed = fs::remove(valuePath(name), ec);
    if (ec) {
        Logger::instance().warn("Store remove for '{}' failed: {}", key, ec.message());
    }
    if (isHashedName(name)) {
        fs::remove(keyPath(name), ec);
    }
    return removed;
}

std::vector<std::string> FileStore::keys() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> result;
    std::error_code ec;
    fs::directory_iterator it(m_root, ec);
    if (ec) {
        return result;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != kValueExtension) {
            continue;
        }
        auto stem = entry.path().stem().string();
        auto key = isHashedName(stem) ? readFile(keyPath(stem)) : decodeKey(stem);
        if (key) {
            result.push_back(*key);
        }
    }
    return result;
}

} // namespace harbor::core::storage
