#pragma once

/**
 * DownloadItem.hpp
 *
 * A single download tracked by the scheduler, plus the request used to
 * create one.
 */

#include "DownloadError.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace harbor::core::downloader {

/**
 * Download item status
 */
enum class DownloadStatus {
    Pending,
    Downloading,
    Paused,
    Completed,
    Failed
};

const char* statusName(DownloadStatus status);
std::optional<DownloadStatus> parseStatus(const std::string& name);

/**
 * Why a transfer failed. Present exactly when status == Failed.
 */
struct TransferFailure {
    ErrorCode code{ErrorCode::TransferError};
    std::string message;
};

/**
 * Caller-supplied description of a new download
 */
struct DownloadRequest {
    // Generated when empty
    std::string id;

    std::string sourceUrl;

    // Derived from the download directory and id when empty
    std::string destinationPath;

    std::string displayTitle;

    // Free-form grouping key (series, album, season ...)
    std::string groupKey;

    std::string thumbnailUrl;
};

/**
 * DownloadItem - one entry of the authoritative set
 */
struct DownloadItem {
    std::string id;
    std::string sourceUrl;
    std::string destinationPath;
    std::string displayTitle;
    std::string groupKey;
    std::string thumbnailUrl;

    // 0 until known
    uint64_t sizeBytes{0};

    // 0.0 - 1.0, exactly 1.0 iff Completed
    double progress{0.0};

    DownloadStatus status{DownloadStatus::Pending};
    std::chrono::system_clock::time_point createdAt;

    std::optional<std::string> resumeToken;
    std::optional<TransferFailure> failure;

    bool exportedToGallery{false};

    bool isTerminal() const {
        return status == DownloadStatus::Completed || status == DownloadStatus::Failed;
    }

    // Holding a transfer slot
    bool isRunning() const {
        return status == DownloadStatus::Downloading || status == DownloadStatus::Paused;
    }

    nlohmann::json toJson() const;

    /**
     * Read an item in the current record layout. Missing fields take
     * their defaults.
     */
    static DownloadItem fromJson(const nlohmann::json& j);

    /**
     * Read an item written before the snapshot carried a schema version
     * (downloadUrl / filePath / title / size / dateAdded field names).
     */
    static DownloadItem fromLegacyJson(const nlohmann::json& j);
};

} // namespace harbor::core::downloader
