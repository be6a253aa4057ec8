/**
 * LocalFileSystem.cpp
 */

#include "FileSystem.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <fstream>

namespace harbor::core::downloader {

namespace {

class FileChunkWriter : public ChunkWriter {
public:
    explicit FileChunkWriter(const std::string& path)
        : m_file(path, std::ios::binary | std::ios::trunc) {}

    bool isOpen() const { return m_file.is_open(); }

    bool writeChunk(const char* data, size_t size) override {
        m_file.write(data, static_cast<std::streamsize>(size));
        return static_cast<bool>(m_file);
    }

    bool close() override {
        if (!m_file.is_open()) {
            return true;
        }
        m_file.flush();
        bool ok = static_cast<bool>(m_file);
        m_file.close();
        return ok && !m_file.fail();
    }

private:
    std::ofstream m_file;
};

} // namespace

std::unique_ptr<ChunkWriter> LocalFileSystem::openWriter(const std::string& path) {
    auto parent = fs::path(path).parent_path();
    if (!utils::FileUtils::createDirectories(parent)) {
        Logger::instance().warn("Cannot create directory {}", parent.string());
        return nullptr;
    }

    auto writer = std::make_unique<FileChunkWriter>(path);
    if (!writer->isOpen()) {
        return nullptr;
    }
    return writer;
}

bool LocalFileSystem::deleteFile(const std::string& path) {
    return utils::FileUtils::deleteFile(path);
}

std::optional<uint64_t> LocalFileSystem::stat(const std::string& path) const {
    return utils::FileUtils::getFileSize(path);
}

bool LocalFileSystem::copyFile(const std::string& source, const std::string& destination) {
    auto parent = fs::path(destination).parent_path();
    if (!utils::FileUtils::createDirectories(parent)) {
        return false;
    }
    return utils::FileUtils::copyFile(source, destination, true);
}

bool LocalFileSystem::moveFile(const std::string& source, const std::string& destination) {
    if (!utils::FileUtils::moveFile(source, destination)) {
        Logger::instance().warn("Cannot move {} to {}", source, destination);
        return false;
    }
    return true;
}

bool LocalFileSystem::createDirectories(const std::string& path) {
    return utils::FileUtils::createDirectories(path);
}

} // namespace harbor::core::downloader
