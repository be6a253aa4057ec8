// Harbor - File Utilities
// Thin error-code wrappers over std::filesystem

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace harbor::utils {

/**
 * @brief File and directory utilities. None of these throw.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool copyFile(const fs::path& source, const fs::path& destination, bool overwrite = false);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool deleteFile(const fs::path& path);
    static std::optional<uint64_t> getFileSize(const fs::path& path);
};

} // namespace harbor::utils
