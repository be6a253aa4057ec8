/**
 * SideEffects.cpp
 */

#include "SideEffects.hpp"
#include "../Logger.hpp"

#include <filesystem>

namespace harbor::core::downloader {

const char* downloadEventName(DownloadEvent event) {
    switch (event) {
        case DownloadEvent::Started:   return "started";
        case DownloadEvent::Progress:  return "progress";
        case DownloadEvent::Completed: return "completed";
        case DownloadEvent::Failed:    return "failed";
        case DownloadEvent::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// EventBusNotifier
// ============================================================================

std::string EventBusNotifier::topic(DownloadEvent event) {
    return std::string("download.") + downloadEventName(event);
}

void EventBusNotifier::notify(DownloadEvent event, const DownloadItem& item) {
    json payload = {
        {"id", item.id},
        {"title", item.displayTitle},
        {"status", statusName(item.status)},
        {"progress", item.progress},
        {"sizeBytes", item.sizeBytes},
        {"destinationPath", item.destinationPath}
    };
    if (item.failure) {
        payload["error"] = item.failure->message;
    }

    m_bus.emit(topic(event), payload);
}

// ============================================================================
// DirectoryGalleryExporter
// ============================================================================

DirectoryGalleryExporter::DirectoryGalleryExporter(std::shared_ptr<FileSystem> fileSystem,
                                                   std::string directory)
    : m_fileSystem(std::move(fileSystem))
    , m_directory(std::move(directory)) {
}

bool DirectoryGalleryExporter::exportItem(const DownloadItem& item) {
    if (m_directory.empty() || !m_fileSystem) {
        return false;
    }

    auto name = std::filesystem::path(item.destinationPath).filename();
    if (name.empty()) {
        return false;
    }

    auto target = (std::filesystem::path(m_directory) / name).string();
    if (!m_fileSystem->copyFile(item.destinationPath, target)) {
        Logger::instance().warn("Gallery copy failed: {} -> {}", item.destinationPath, target);
        return false;
    }

    Logger::instance().debug("Exported {} to {}", item.id, target);
    return true;
}

// ============================================================================
// DownloadSideEffects
// ============================================================================

void DownloadSideEffects::setNotifier(std::shared_ptr<Notifier> notifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_notifier = std::move(notifier);
}

void DownloadSideEffects::setPermissionGate(std::shared_ptr<PermissionGate> gate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_gate = std::move(gate);
}

void DownloadSideEffects::setGalleryExporter(std::shared_ptr<GalleryExporter> exporter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_exporter = std::move(exporter);
}

void DownloadSideEffects::notify(DownloadEvent event, const DownloadItem& item) {
    std::shared_ptr<Notifier> notifier;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        notifier = m_notifier;
    }
    if (!notifier) {
        return;
    }

    try {
        notifier->notify(event, item);
    } catch (const std::exception& e) {
        Logger::instance().warn("Notification '{}' for {} failed: {}",
                                downloadEventName(event), item.id, e.what());
    }
}

bool DownloadSideEffects::exportToGallery(const DownloadItem& item) {
    std::shared_ptr<PermissionGate> gate;
    std::shared_ptr<GalleryExporter> exporter;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        gate = m_gate;
        exporter = m_exporter;
    }
    if (!exporter) {
        return false;
    }

    try {
        if (gate && !gate->isGranted()) {
            Logger::instance().warn("{}: {} kept in app storage only",
                                    errorCodeName(ErrorCode::PermissionDenied), item.id);
            return false;
        }
        return exporter->exportItem(item);
    } catch (const std::exception& e) {
        Logger::instance().warn("Gallery export of {} failed: {}", item.id, e.what());
        return false;
    }
}

bool DownloadSideEffects::requestPermissions() {
    std::shared_ptr<PermissionGate> gate;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        gate = m_gate;
    }
    if (!gate) {
        return true;
    }

    try {
        if (gate->isGranted()) {
            return true;
        }
        bool granted = gate->request();
        if (!granted) {
            Logger::instance().warn("{}: gallery access not granted",
                                    errorCodeName(ErrorCode::PermissionDenied));
        }
        return granted;
    } catch (const std::exception& e) {
        Logger::instance().warn("Permission request failed: {}", e.what());
        return false;
    }
}

} // namespace harbor::core::downloader
