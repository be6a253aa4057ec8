#pragma once

/**
 * TestHelpers.hpp
 */

#include "core/storage/DurableStore.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <string>
#include <thread>

namespace harbor::test {

/**
 * Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto name = "harbor_test_" + std::to_string(rd()) + "_" + std::to_string(rd());
        m_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    std::string file(const std::string& name) const {
        return (m_path / name).string();
    }

private:
    std::filesystem::path m_path;
};

/**
 * Poll until pred() holds or the timeout elapses
 */
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

/**
 * MemoryStore that counts writes and can be told to fail them
 */
class CountingStore : public core::storage::MemoryStore {
public:
    bool write(const std::string& key, const std::string& bytes) override {
        ++m_writes;
        if (m_failWrites) {
            return false;
        }
        return MemoryStore::write(key, bytes);
    }

    size_t writes() const { return m_writes.load(); }
    void failWrites(bool fail) { m_failWrites = fail; }

private:
    std::atomic<size_t> m_writes{0};
    std::atomic<bool> m_failWrites{false};
};

} // namespace harbor::test
