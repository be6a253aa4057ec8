/**
 * FileUtils.cpp
 */

#include "FileUtils.hpp"

namespace harbor::utils {

bool FileUtils::createDirectories(const fs::path& path) {
    if (path.empty()) return true;
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::copyFile(const fs::path& source, const fs::path& destination, bool overwrite) {
    std::error_code ec;
    auto opts = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    return fs::copy_file(source, destination, opts, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    return !ec;
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<uint64_t> FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

} // namespace harbor::utils
