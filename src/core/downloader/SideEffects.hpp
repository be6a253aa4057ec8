#pragma once

/**
 * SideEffects.hpp
 *
 * Best-effort ports invoked after a state transition: notifications,
 * the gallery permission gate and gallery export. Nothing here can
 * change an item's state.
 */

#include "DownloadItem.hpp"
#include "FileSystem.hpp"
#include "../EventBus.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace harbor::core::downloader {

enum class DownloadEvent {
    Started,
    Progress,
    Completed,
    Failed,
    Cancelled
};

const char* downloadEventName(DownloadEvent event);

/**
 * Notifier - receives lifecycle events
 */
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(DownloadEvent event, const DownloadItem& item) = 0;
};

/**
 * PermissionGate - capability check for writing to shared storage
 */
class PermissionGate {
public:
    virtual ~PermissionGate() = default;

    virtual bool isGranted() const = 0;

    /**
     * Ask for the capability
     * @return true if granted afterwards
     */
    virtual bool request() = 0;
};

/**
 * GalleryExporter - copies a completed download somewhere shared
 */
class GalleryExporter {
public:
    virtual ~GalleryExporter() = default;
    virtual bool exportItem(const DownloadItem& item) = 0;
};

/**
 * Publishes "download.<event>" on an EventBus
 */
class EventBusNotifier : public Notifier {
public:
    explicit EventBusNotifier(EventBus& bus) : m_bus(bus) {}

    void notify(DownloadEvent event, const DownloadItem& item) override;

    static std::string topic(DownloadEvent event);

private:
    EventBus& m_bus;
};

/**
 * Answers from configuration; request() cannot change the answer
 */
class StaticPermissionGate : public PermissionGate {
public:
    explicit StaticPermissionGate(bool granted) : m_granted(granted) {}

    bool isGranted() const override { return m_granted; }
    bool request() override { return m_granted; }

private:
    bool m_granted;
};

/**
 * Copies completed files into a gallery directory, keeping the file name
 */
class DirectoryGalleryExporter : public GalleryExporter {
public:
    DirectoryGalleryExporter(std::shared_ptr<FileSystem> fileSystem, std::string directory);

    bool exportItem(const DownloadItem& item) override;

    const std::string& directory() const { return m_directory; }

private:
    std::shared_ptr<FileSystem> m_fileSystem;
    std::string m_directory;
};

/**
 * DownloadSideEffects - the scheduler's single side-effect port
 *
 * Every call is guarded: exceptions from collaborators are logged and
 * never reach the scheduler. Any collaborator may be absent.
 */
class DownloadSideEffects {
public:
    void setNotifier(std::shared_ptr<Notifier> notifier);
    void setPermissionGate(std::shared_ptr<PermissionGate> gate);
    void setGalleryExporter(std::shared_ptr<GalleryExporter> exporter);

    void notify(DownloadEvent event, const DownloadItem& item);

    /**
     * Export a completed item if an exporter is installed and the gate allows it
     * @return true if the item now lives in the gallery
     */
    bool exportToGallery(const DownloadItem& item);

    /**
     * Ask the permission gate, if any
     * @return true if granted or no gate is installed
     */
    bool requestPermissions();

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<Notifier> m_notifier;
    std::shared_ptr<PermissionGate> m_gate;
    std::shared_ptr<GalleryExporter> m_exporter;
};

} // namespace harbor::core::downloader
