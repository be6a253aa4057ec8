/**
 * DownloadScheduler.cpp
 *
 * Implementation of the bounded-concurrency download scheduler.
 */

#include "DownloadScheduler.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace harbor::core::downloader {

DownloadScheduler::DownloadScheduler(std::shared_ptr<TransferExecutor> executor,
                                     std::shared_ptr<FileSystem> fileSystem,
                                     std::shared_ptr<PersistenceGateway> gateway,
                                     SchedulerOptions options,
                                     std::shared_ptr<DownloadSideEffects> sideEffects)
    : m_executor(std::move(executor))
    , m_fileSystem(std::move(fileSystem))
    , m_gateway(std::move(gateway))
    , m_sideEffects(sideEffects ? std::move(sideEffects) : std::make_shared<DownloadSideEffects>())
    , m_options(std::move(options)) {

    if (m_options.maxConcurrent == 0) {
        m_options.maxConcurrent = 1;
    }

    // Cancelled transfers may still be draining while their successors run
    m_poolSize = m_options.maxConcurrent * 2;
    m_threadPool = std::make_unique<ThreadPool>(m_poolSize);

    Logger::instance().info("DownloadScheduler ready (max concurrent: {})", m_options.maxConcurrent);
}

DownloadScheduler::~DownloadScheduler() {
    shutdown();
}

void DownloadScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;

        Logger::instance().info("Shutting down DownloadScheduler ({} active, {} queued)",
                                m_active.size(), m_queue.size());

        for (auto& [id, transfer] : m_active) {
            transfer.control->abort();
        }
        m_active.clear();

        persistLocked();
    }
    m_idleCondition.notify_all();

    // Joins the workers; their remaining events are stale and ignored
    m_threadPool.reset();

    if (m_gateway) {
        m_gateway->flush();
        m_gateway->shutdown();
    }
}

std::string DownloadScheduler::enqueue(const DownloadRequest& request) {
    if (request.sourceUrl.empty()) {
        throw DownloadError(ErrorCode::InvalidTransition, "Download request has no source URL");
    }

    Notifications notes;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ensureRunning();

        id = request.id.empty() ? generateId() : request.id;

        bool queued = std::find(m_queue.begin(), m_queue.end(), id) != m_queue.end();
        if (m_active.count(id) || queued) {
            throw DownloadError(ErrorCode::AlreadyInProgress, "Download already in progress: " + id);
        }

        // Retry of a finished item replaces it
        eraseItemLocked(id);

        DownloadItem item;
        item.id = id;
        item.sourceUrl = request.sourceUrl;
        item.destinationPath = request.destinationPath.empty()
            ? defaultDestination(id, request.sourceUrl)
            : request.destinationPath;
        item.displayTitle = request.displayTitle.empty() ? id : request.displayTitle;
        item.groupKey = request.groupKey;
        item.thumbnailUrl = request.thumbnailUrl;
        item.createdAt = std::chrono::system_clock::now();
        item.status = DownloadStatus::Pending;

        m_items.push_back(std::move(item));

        if (hasFreeSlotLocked()) {
            startLocked(m_items.back(), notes);
        } else {
            m_queue.push_back(id);
            Logger::instance().debug("Queued download {} (position {})", id, m_queue.size());
        }

        persistLocked();
    }

    dispatch(notes);
    return id;
}

void DownloadScheduler::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureRunning();
    auto& item = requireLocked(id);

    auto it = m_active.find(id);
    if (it == m_active.end() || item.status != DownloadStatus::Downloading) {
        throw DownloadError(ErrorCode::InvalidTransition,
                            std::string("Cannot pause download in state ") + statusName(item.status));
    }

    it->second.control->pause();
    item.status = DownloadStatus::Paused;
    persistLocked();

    Logger::instance().info("Paused download {}", id);
}

void DownloadScheduler::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureRunning();
    auto& item = requireLocked(id);

    auto it = m_active.find(id);
    if (it == m_active.end() || item.status != DownloadStatus::Paused) {
        throw DownloadError(ErrorCode::InvalidTransition,
                            std::string("Cannot resume download in state ") + statusName(item.status));
    }

    it->second.control->resume();
    item.status = DownloadStatus::Downloading;
    persistLocked();

    Logger::instance().info("Resumed download {}", id);
}

void DownloadScheduler::cancel(const std::string& id) {
    Notifications notes;
    std::optional<std::string> partialOutput;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ensureRunning();
        auto& item = requireLocked(id);

        if (item.isTerminal()) {
            throw DownloadError(ErrorCode::InvalidTransition,
                                std::string("Cannot cancel download in state ") + statusName(item.status));
        }

        auto it = m_active.find(id);
        if (it != m_active.end()) {
            it->second.control->abort();
            // The run finished and renamed its output before seeing the abort
            if (it->second.control->isCommitted()) {
                deleteOutputLocked(item.destinationPath);
            }
            partialOutput = it->second.partialPath;
            m_active.erase(it);
        } else {
            m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), id), m_queue.end());
        }

        notes.push_back({DownloadEvent::Cancelled, item});
        eraseItemLocked(id);

        admitNextLocked(notes);
        persistLocked();
        notifyIdleLocked();
    }

    // Private to the cancelled run; the executor also discards it once it
    // sees the abort
    if (partialOutput && m_fileSystem && m_fileSystem->stat(*partialOutput)) {
        m_fileSystem->deleteFile(*partialOutput);
    }

    Logger::instance().info("Cancelled download {}", id);
    dispatch(notes);
}

void DownloadScheduler::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureRunning();
    auto& item = requireLocked(id);

    if (!item.isTerminal()) {
        throw DownloadError(ErrorCode::InvalidTransition,
                            std::string("Cannot remove download in state ") + statusName(item.status));
    }

    // Deleted before the id is released, so a re-enqueue cannot lose its file
    deleteOutputLocked(item.destinationPath);
    eraseItemLocked(id);
    persistLocked();

    Logger::instance().info("Removed download {}", id);
}

void DownloadScheduler::clearAll() {
    Notifications notes;
    std::vector<std::string> partials;
    size_t deleted = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ensureRunning();

        for (auto& [id, transfer] : m_active) {
            transfer.control->abort();
            partials.push_back(transfer.partialPath);
        }

        for (const auto& item : m_items) {
            if (!item.isTerminal()) {
                notes.push_back({DownloadEvent::Cancelled, item});
            }

            auto it = m_active.find(item.id);
            bool hasOutput = item.isTerminal() ||
                (it != m_active.end() && it->second.control->isCommitted());
            if (hasOutput && m_fileSystem && m_fileSystem->stat(item.destinationPath)) {
                deleteOutputLocked(item.destinationPath);
                ++deleted;
            }
        }

        m_active.clear();
        m_queue.clear();
        m_items.clear();

        persistLocked();
        notifyIdleLocked();
    }

    if (m_fileSystem) {
        for (const auto& path : partials) {
            if (m_fileSystem->stat(path)) {
                m_fileSystem->deleteFile(path);
            }
        }
    }

    Logger::instance().info("Cleared all downloads ({} file(s) deleted)", deleted);
    dispatch(notes);
}

void DownloadScheduler::restore(std::vector<DownloadItem> items) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureRunning();

    size_t restored = 0;
    size_t interrupted = 0;

    for (auto& item : items) {
        if (item.id.empty() || findLocked(item.id)) {
            continue;
        }

        if (!item.isTerminal()) {
            item.status = DownloadStatus::Failed;
            item.progress = std::min(item.progress, 0.99);
            item.failure = TransferFailure{ErrorCode::TransferError, "interrupted"};
            ++interrupted;
        }

        m_items.push_back(std::move(item));
        ++restored;
    }

    if (interrupted > 0) {
        persistLocked();
    }

    Logger::instance().info("Restored {} download(s), {} interrupted", restored, interrupted);
}

size_t DownloadScheduler::validateAndCleanup() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureRunning();
    if (!m_fileSystem) return 0;

    size_t before = m_items.size();
    m_items.erase(
        std::remove_if(m_items.begin(), m_items.end(), [this](const DownloadItem& item) {
            if (item.status != DownloadStatus::Completed) {
                return false;
            }
            if (m_fileSystem->stat(item.destinationPath)) {
                return false;
            }
            Logger::instance().warn("File missing for completed download {}: {}",
                                    item.id, item.destinationPath);
            return true;
        }),
        m_items.end()
    );

    size_t dropped = before - m_items.size();
    if (dropped > 0) {
        persistLocked();
    }
    return dropped;
}

std::vector<DownloadItem> DownloadScheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items;
}

std::optional<DownloadItem> DownloadScheduler::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& item : m_items) {
        if (item.id == id) {
            return item;
        }
    }
    return std::nullopt;
}

size_t DownloadScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

size_t DownloadScheduler::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool DownloadScheduler::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this] {
        return (m_active.empty() && m_queue.empty()) || m_shutdown;
    });
}

void DownloadScheduler::onTransferEvent(const std::string& id,
                                        const std::shared_ptr<TransferControl>& control,
                                        const TransferEvent& event) {
    Notifications notes;
    std::optional<DownloadItem> completed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        // Cancelled, cleared or superseded by a newer run of the same id
        auto it = m_active.find(id);
        if (it == m_active.end() || it->second.control != control) {
            return;
        }

        DownloadItem* item = findLocked(id);
        if (!item) {
            m_active.erase(it);
            return;
        }

        switch (event.type) {
            case TransferEventType::Progress: {
                if (event.bytesTotal > 0) {
                    item->sizeBytes = event.bytesTotal;
                    double ratio = static_cast<double>(event.bytesWritten) /
                                   static_cast<double>(event.bytesTotal);
                    item->progress = std::max(item->progress, std::min(ratio, 0.99));
                }

                int percent = static_cast<int>(item->progress * 100.0);
                if (percent != it->second.lastPercent) {
                    it->second.lastPercent = percent;
                    notes.push_back({DownloadEvent::Progress, *item});
                    persistLocked();
                }
                break;
            }

            case TransferEventType::Completed:
                item->status = DownloadStatus::Completed;
                item->progress = 1.0;
                item->sizeBytes = event.bytesTotal > 0 ? event.bytesTotal : event.bytesWritten;
                item->failure.reset();
                m_active.erase(it);

                Logger::instance().info("Download completed: {} ({} bytes)", id, item->sizeBytes);
                notes.push_back({DownloadEvent::Completed, *item});
                completed = *item;

                admitNextLocked(notes);
                persistLocked();
                notifyIdleLocked();
                break;

            case TransferEventType::Failed:
            case TransferEventType::Aborted:
                item->status = DownloadStatus::Failed;
                item->progress = std::min(item->progress, 0.99);
                item->failure = TransferFailure{
                    ErrorCode::TransferError,
                    event.error.empty() ? std::string("aborted") : event.error
                };
                m_active.erase(it);

                Logger::instance().error("Download failed: {} - {}", id, item->failure->message);
                notes.push_back({DownloadEvent::Failed, *item});

                admitNextLocked(notes);
                persistLocked();
                notifyIdleLocked();
                break;
        }
    }

    dispatch(notes);

    if (completed) {
        exportToGallery(*completed);
    }
}

void DownloadScheduler::onRunFinished() {
    Notifications notes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_runningTransfers;

        size_t queued = m_queue.size();
        admitNextLocked(notes);
        if (m_queue.size() != queued) {
            persistLocked();
        }
    }
    dispatch(notes);
}

void DownloadScheduler::startLocked(DownloadItem& item, Notifications& notes) {
    item.status = DownloadStatus::Downloading;
    item.failure.reset();

    auto control = std::make_shared<TransferControl>();

    TransferRequest request{item.id, item.sourceUrl, item.destinationPath,
                            item.destinationPath + ".part" + std::to_string(++m_nextRun)};
    m_active[item.id] = ActiveTransfer{control, -1, request.partialPath};

    ++m_runningTransfers;
    m_threadPool->submit([this, request, control] {
        m_executor->run(request, *control, [this, &request, &control](const TransferEvent& event) {
            onTransferEvent(request.id, control, event);
        });
        onRunFinished();
    });

    Logger::instance().info("Started download {}: {}", item.id, item.sourceUrl);
    notes.push_back({DownloadEvent::Started, item});
}

void DownloadScheduler::admitNextLocked(Notifications& notes) {
    if (m_shutdown) {
        return;
    }

    while (hasFreeSlotLocked() && !m_queue.empty()) {
        std::string next = m_queue.front();
        m_queue.pop_front();

        DownloadItem* item = findLocked(next);
        if (!item) {
            continue;
        }
        startLocked(*item, notes);
    }
}

bool DownloadScheduler::hasFreeSlotLocked() const {
    return m_active.size() < m_options.maxConcurrent && m_runningTransfers < m_poolSize;
}

void DownloadScheduler::deleteOutputLocked(const std::string& path) {
    if (!m_fileSystem || path.empty() || !m_fileSystem->stat(path)) {
        return;
    }
    if (!m_fileSystem->deleteFile(path)) {
        Logger::instance().warn("Could not delete {}", path);
    }
}

void DownloadScheduler::persistLocked() {
    if (m_gateway) {
        m_gateway->save(m_items);
    }
}

void DownloadScheduler::notifyIdleLocked() {
    if (m_active.empty() && m_queue.empty()) {
        m_idleCondition.notify_all();
    }
}

void DownloadScheduler::ensureRunning() const {
    if (m_shutdown) {
        throw DownloadError(ErrorCode::InvalidTransition, "Download scheduler is shut down");
    }
}

DownloadItem* DownloadScheduler::findLocked(const std::string& id) {
    for (auto& item : m_items) {
        if (item.id == id) {
            return &item;
        }
    }
    return nullptr;
}

DownloadItem& DownloadScheduler::requireLocked(const std::string& id) {
    DownloadItem* item = findLocked(id);
    if (!item) {
        throw DownloadError(ErrorCode::NotFound, "Unknown download: " + id);
    }
    return *item;
}

void DownloadScheduler::eraseItemLocked(const std::string& id) {
    m_items.erase(
        std::remove_if(m_items.begin(), m_items.end(),
            [&id](const DownloadItem& item) { return item.id == id; }),
        m_items.end()
    );
}

void DownloadScheduler::dispatch(const Notifications& notes) {
    for (const auto& note : notes) {
        m_sideEffects->notify(note.event, note.item);
    }
}

void DownloadScheduler::exportToGallery(const DownloadItem& item) {
    if (!m_sideEffects->exportToGallery(item)) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    DownloadItem* current = findLocked(item.id);
    if (current && current->status == DownloadStatus::Completed) {
        current->exportedToGallery = true;
        persistLocked();
    }
}

std::string DownloadScheduler::generateId() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "dl_" + std::to_string(now) + "_" + std::to_string(++m_nextId);
}

std::string DownloadScheduler::defaultDestination(const std::string& id, const std::string& url) const {
    std::string path = url;

    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.resize(cut);
    }

    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }

    std::string extension = std::filesystem::path(path).extension().string();
    bool usable = extension.size() >= 2 && extension.size() <= 8 &&
        std::all_of(extension.begin() + 1, extension.end(),
                    [](unsigned char c) { return std::isalnum(c) != 0; });
    if (!usable) {
        extension = ".bin";
    }

    return (std::filesystem::path(m_options.downloadDirectory) / (id + extension)).string();
}

} // namespace harbor::core::downloader
