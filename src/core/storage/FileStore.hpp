#pragma once

/**
 * FileStore.hpp
 *
 * DurableStore backed by one file per key in a directory.
 */

#include "DurableStore.hpp"

#include <filesystem>
#include <mutex>

namespace harbor::core::storage {

/**
 * FileStore
 *
 * Keys are percent-encoded into file names, so any key string is safe.
 * Keys whose encoding would exceed the file-name limit are stored under
 * their SHA-256 instead, with the full key in a companion file.
 * Writes go to a temporary file that is renamed over the target, so a
 * crash mid-write leaves the previous value intact.
 */
class FileStore : public DurableStore {
public:
    /**
     * @param root Directory holding the value files (created on demand)
     */
    explicit FileStore(std::filesystem::path root);

    std::optional<std::string> read(const std::string& key) const override;
    bool write(const std::string& key, const std::string& bytes) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() const override;

    const std::filesystem::path& root() const { return m_root; }

    static std::string encodeKey(const std::string& key);
    static std::optional<std::string> decodeKey(const std::string& fileName);

    /**
     * File name (without extension) holding key's value
     * @return "" if no name can be derived
     */
    static std::string fileNameFor(const std::string& key);

private:
    static bool isHashedName(const std::string& name);
    static std::optional<std::string> readFile(const std::filesystem::path& path);
    static bool replaceFile(const std::filesystem::path& path, const std::string& bytes);

    std::filesystem::path valuePath(const std::string& name) const;
    std::filesystem::path keyPath(const std::string& name) const;

    std::filesystem::path m_root;
    mutable std::mutex m_mutex;
};

} // namespace harbor::core::storage
