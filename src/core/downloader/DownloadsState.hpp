#pragma once

/**
 * DownloadsState.hpp
 *
 * Read-mostly view over the scheduler for UI shells and the CLI.
 * Holds no copy of its own: every query derives from a fresh snapshot.
 */

#include "DownloadScheduler.hpp"

#include <optional>
#include <string>
#include <vector>

namespace harbor::core::downloader {

class DownloadsState {
public:
    explicit DownloadsState(DownloadScheduler& scheduler) : m_scheduler(scheduler) {}

    // Views

    std::vector<DownloadItem> all() const;

    /**
     * Items currently transferring (status Downloading)
     */
    std::vector<DownloadItem> active() const;

    /**
     * Items waiting for a slot (status Pending)
     */
    std::vector<DownloadItem> queued() const;

    /**
     * Items not yet finished: pending, downloading or paused
     */
    std::vector<DownloadItem> current() const;

    /**
     * Sum of sizeBytes over completed items
     */
    uint64_t totalBytesUsed() const;

    bool isBusy() const;

    std::optional<DownloadItem> byId(const std::string& id) const;
    std::vector<DownloadItem> byGroup(const std::string& groupKey) const;

    // Dispatch. Failures are logged and reported as false.

    /**
     * @return Item id, or std::nullopt if the request was rejected
     */
    std::optional<std::string> startDownload(const DownloadRequest& request);

    bool pauseDownload(const std::string& id);
    bool resumeDownload(const std::string& id);
    bool cancelDownload(const std::string& id);
    bool removeDownload(const std::string& id);
    bool clearAllDownloads();

    /**
     * @return Number of completed items dropped because their file is gone
     */
    size_t validateAndCleanupDownloads();

    bool requestDownloadPermissions();

private:
    template<typename Pred>
    std::vector<DownloadItem> filter(Pred pred) const;

    DownloadScheduler& m_scheduler;
};

} // namespace harbor::core::downloader
