/**
 * DownloadsState.cpp
 */

#include "DownloadsState.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace harbor::core::downloader {

namespace {

void logRejected(const char* operation, const std::string& id, const DownloadError& e) {
    Logger::instance().warn("{} {} rejected ({}): {}", operation, id, errorCodeName(e.code()), e.what());
}

} // namespace

template<typename Pred>
std::vector<DownloadItem> DownloadsState::filter(Pred pred) const {
    auto items = m_scheduler.snapshot();
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&pred](const DownloadItem& item) { return !pred(item); }),
                items.end());
    return items;
}

std::vector<DownloadItem> DownloadsState::all() const {
    return m_scheduler.snapshot();
}

std::vector<DownloadItem> DownloadsState::active() const {
    return filter([](const DownloadItem& item) {
        return item.status == DownloadStatus::Downloading;
    });
}

std::vector<DownloadItem> DownloadsState::queued() const {
    return filter([](const DownloadItem& item) {
        return item.status == DownloadStatus::Pending;
    });
}

std::vector<DownloadItem> DownloadsState::current() const {
    return filter([](const DownloadItem& item) {
        return !item.isTerminal();
    });
}

uint64_t DownloadsState::totalBytesUsed() const {
    uint64_t total = 0;
    for (const auto& item : m_scheduler.snapshot()) {
        if (item.status == DownloadStatus::Completed) {
            total += item.sizeBytes;
        }
    }
    return total;
}

bool DownloadsState::isBusy() const {
    return !active().empty();
}

std::optional<DownloadItem> DownloadsState::byId(const std::string& id) const {
    return m_scheduler.find(id);
}

std::vector<DownloadItem> DownloadsState::byGroup(const std::string& groupKey) const {
    return filter([&groupKey](const DownloadItem& item) {
        return item.groupKey == groupKey;
    });
}

std::optional<std::string> DownloadsState::startDownload(const DownloadRequest& request) {
    try {
        return m_scheduler.enqueue(request);
    } catch (const DownloadError& e) {
        logRejected("Start", request.id.empty() ? request.sourceUrl : request.id, e);
        return std::nullopt;
    }
}

bool DownloadsState::pauseDownload(const std::string& id) {
    try {
        m_scheduler.pause(id);
        return true;
    } catch (const DownloadError& e) {
        logRejected("Pause", id, e);
        return false;
    }
}

bool DownloadsState::resumeDownload(const std::string& id) {
    try {
        m_scheduler.resume(id);
        return true;
    } catch (const DownloadError& e) {
        logRejected("Resume", id, e);
        return false;
    }
}

bool DownloadsState::cancelDownload(const std::string& id) {
    try {
        m_scheduler.cancel(id);
        return true;
    } catch (const DownloadError& e) {
        logRejected("Cancel", id, e);
        return false;
    }
}

bool DownloadsState::removeDownload(const std::string& id) {
    try {
        m_scheduler.remove(id);
        return true;
    } catch (const DownloadError& e) {
        logRejected("Remove", id, e);
        return false;
    }
}

bool DownloadsState::clearAllDownloads() {
    try {
        m_scheduler.clearAll();
        return true;
    } catch (const DownloadError& e) {
        logRejected("Clear", "all", e);
        return false;
    }
}

size_t DownloadsState::validateAndCleanupDownloads() {
    try {
        return m_scheduler.validateAndCleanup();
    } catch (const DownloadError& e) {
        logRejected("Validate", "all", e);
        return 0;
    }
}

bool DownloadsState::requestDownloadPermissions() {
    return m_scheduler.sideEffects().requestPermissions();
}

} // namespace harbor::core::downloader
