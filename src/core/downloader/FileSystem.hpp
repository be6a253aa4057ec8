#pragma once

/**
 * FileSystem.hpp
 *
 * Filesystem seam used by the executor and by remove/cancel/clear.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace harbor::core::downloader {

/**
 * Sequential writer for one output file
 */
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    virtual bool writeChunk(const char* data, size_t size) = 0;

    /**
     * Flush and close
     * @return false if buffered data could not be written
     */
    virtual bool close() = 0;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * Create or truncate a file, creating parent directories
     * @return nullptr if the file cannot be opened
     */
    virtual std::unique_ptr<ChunkWriter> openWriter(const std::string& path) = 0;

    virtual bool deleteFile(const std::string& path) = 0;

    /**
     * @return File size, or std::nullopt if there is no regular file at path
     */
    virtual std::optional<uint64_t> stat(const std::string& path) const = 0;

    virtual bool copyFile(const std::string& source, const std::string& destination) = 0;

    /**
     * Rename source over destination, replacing any existing file
     */
    virtual bool moveFile(const std::string& source, const std::string& destination) = 0;

    virtual bool createDirectories(const std::string& path) = 0;
};

/**
 * LocalFileSystem - the process's own filesystem
 */
class LocalFileSystem : public FileSystem {
public:
    std::unique_ptr<ChunkWriter> openWriter(const std::string& path) override;
    bool deleteFile(const std::string& path) override;
    std::optional<uint64_t> stat(const std::string& path) const override;
    bool copyFile(const std::string& source, const std::string& destination) override;
    bool moveFile(const std::string& source, const std::string& destination) override;
    bool createDirectories(const std::string& path) override;
};

} // namespace harbor::core::downloader
