#pragma once

/**
 * DownloadScheduler.hpp
 *
 * Bounded-concurrency download scheduler.
 * Owns the authoritative item set, admission control, the FIFO queue
 * and every status transition.
 */

#include "DownloadItem.hpp"
#include "FileSystem.hpp"
#include "PersistenceGateway.hpp"
#include "SideEffects.hpp"
#include "TransferExecutor.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace harbor::core::downloader {

struct SchedulerOptions {
    // Upper bound on items holding a transfer slot (downloading or paused)
    size_t maxConcurrent{2};

    // Where downloads without an explicit destination are written
    std::string downloadDirectory;
};

/**
 * DownloadScheduler
 *
 * Features:
 * - At most maxConcurrent transfers; the rest wait in FIFO order
 * - Pause/resume/cancel delivered to the running transfer
 * - Stale transfer events (after cancel or shutdown) are discarded
 * - Each run writes to its own partial file and renames it into place
 *   on success, so a cancelled run never touches a retry's output
 * - A cancelled run keeps its worker until the transport returns; an
 *   item is admitted only while a worker is free for it, otherwise it
 *   stays queued
 * - Every change is handed to the persistence gateway
 * - Side effects run after the transition, outside the lock
 *
 * Control operations throw DownloadError for admission and state errors.
 * Transfer errors never throw; they leave the item Failed.
 */
class DownloadScheduler {
public:
    /**
     * Constructor
     * @param executor Runs one transfer per admitted item
     * @param fileSystem Used to delete outputs on cancel/remove/clear
     * @param gateway Persistence gateway (may be null)
     * @param options Scheduler options
     * @param sideEffects Notification and gallery port (may be null)
     */
    DownloadScheduler(std::shared_ptr<TransferExecutor> executor,
                      std::shared_ptr<FileSystem> fileSystem,
                      std::shared_ptr<PersistenceGateway> gateway,
                      SchedulerOptions options = {},
                      std::shared_ptr<DownloadSideEffects> sideEffects = nullptr);

    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    /**
     * Admit or queue a download
     * @param request Download description; a terminal item with the same
     *        id is replaced
     * @return Item id
     * @throws DownloadError AlreadyInProgress if the id is active or queued
     */
    std::string enqueue(const DownloadRequest& request);

    /**
     * Suspend a downloading item; it keeps its slot
     * @throws DownloadError NotFound, InvalidTransition
     */
    void pause(const std::string& id);

    /**
     * Continue a paused item
     * @throws DownloadError NotFound, InvalidTransition
     */
    void resume(const std::string& id);

    /**
     * Abort or dequeue a non-terminal item and drop it from the set.
     * Frees the slot and admits the next queued item.
     * @throws DownloadError NotFound, InvalidTransition
     */
    void cancel(const std::string& id);

    /**
     * Drop a completed or failed item and delete its file
     * @throws DownloadError NotFound, InvalidTransition
     */
    void remove(const std::string& id);

    /**
     * Cancel everything, delete every stored file and empty the set
     */
    void clearAll();

    /**
     * Load persisted items. Items that were in flight when the previous
     * process ended become Failed ("interrupted"). Ids already present
     * are skipped.
     */
    void restore(std::vector<DownloadItem> items);

    /**
     * Drop completed items whose file is gone
     * @return Number of items dropped
     */
    size_t validateAndCleanup();

    /**
     * Copy of the authoritative set, in insertion order
     */
    std::vector<DownloadItem> snapshot() const;

    std::optional<DownloadItem> find(const std::string& id) const;

    size_t activeCount() const;
    size_t queuedCount() const;

    /**
     * Block until nothing is active or queued
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    /**
     * Abort running transfers, join the workers, flush and stop the
     * persistence gateway. Later control calls throw InvalidTransition.
     */
    void shutdown();

    bool isShutdown() const { return m_shutdown.load(); }

    const SchedulerOptions& options() const { return m_options; }

    DownloadSideEffects& sideEffects() { return *m_sideEffects; }

private:
    struct ActiveTransfer {
        std::shared_ptr<TransferControl> control;
        int lastPercent{-1};
        std::string partialPath;
    };

    struct Notification {
        DownloadEvent event;
        DownloadItem item;
    };

    using Notifications = std::vector<Notification>;

    void onTransferEvent(const std::string& id,
                         const std::shared_ptr<TransferControl>& control,
                         const TransferEvent& event);

    void onRunFinished();

    void startLocked(DownloadItem& item, Notifications& notes);
    void admitNextLocked(Notifications& notes);
    bool hasFreeSlotLocked() const;
    void deleteOutputLocked(const std::string& path);
    void persistLocked();
    void notifyIdleLocked();
    void ensureRunning() const;

    DownloadItem* findLocked(const std::string& id);
    DownloadItem& requireLocked(const std::string& id);
    void eraseItemLocked(const std::string& id);

    void dispatch(const Notifications& notes);
    void exportToGallery(const DownloadItem& item);

    std::string generateId();
    std::string defaultDestination(const std::string& id, const std::string& url) const;

private:
    std::shared_ptr<TransferExecutor> m_executor;
    std::shared_ptr<FileSystem> m_fileSystem;
    std::shared_ptr<PersistenceGateway> m_gateway;
    std::shared_ptr<DownloadSideEffects> m_sideEffects;
    SchedulerOptions m_options;

    std::unique_ptr<ThreadPool> m_threadPool;
    size_t m_poolSize{0};

    // Runs holding a worker, including cancelled ones still draining
    size_t m_runningTransfers{0};
    uint64_t m_nextRun{0};

    std::vector<DownloadItem> m_items;
    std::unordered_map<std::string, ActiveTransfer> m_active;
    std::deque<std::string> m_queue;

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCondition;

    std::atomic<bool> m_shutdown{false};
    std::atomic<uint64_t> m_nextId{0};
};

} // namespace harbor::core::downloader
