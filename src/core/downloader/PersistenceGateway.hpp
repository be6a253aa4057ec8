#pragma once

/**
 * PersistenceGateway.hpp
 *
 * Debounced snapshot writer for the authoritative item set.
 */

#include "DownloadItem.hpp"
#include "../DebounceTimer.hpp"
#include "../storage/DurableStore.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor::core::downloader {

struct PersistenceOptions {
    // Saves arriving within this window collapse into one write
    std::chrono::milliseconds debounce{1000};

    // Durable key holding the snapshot
    std::string key{"downloads"};
};

/**
 * PersistenceGateway
 *
 * save() never blocks on I/O: it records the latest snapshot and arms
 * the debounce timer. Write failures are logged; memory stays
 * authoritative.
 */
class PersistenceGateway {
public:
    static constexpr int kSchemaVersion = 2;

    explicit PersistenceGateway(std::shared_ptr<storage::DurableStore> store,
                                PersistenceOptions options = {});
    ~PersistenceGateway();

    PersistenceGateway(const PersistenceGateway&) = delete;
    PersistenceGateway& operator=(const PersistenceGateway&) = delete;

    /**
     * Schedule a write of this snapshot, replacing any pending one
     */
    void save(std::vector<DownloadItem> items);

    /**
     * Read the last durable snapshot, migrating older layouts
     * @return Items in stored order, empty when nothing is stored or the
     *         snapshot is unreadable
     */
    std::vector<DownloadItem> load() const;

    /**
     * Write the pending snapshot now, if there is one
     * @return false if a write was attempted and failed
     */
    bool flush();

    /**
     * Cancel the debounce timer and join it. A pending snapshot is
     * dropped; call flush() first to keep it.
     */
    void shutdown();

    bool hasPendingWrite() const;
    size_t writeCount() const;

    static std::string serialize(const std::vector<DownloadItem>& items);
    static std::vector<DownloadItem> deserialize(const std::string& bytes);

private:
    bool writePending();

    std::shared_ptr<storage::DurableStore> m_store;
    PersistenceOptions m_options;

    mutable std::mutex m_mutex;
    std::optional<std::vector<DownloadItem>> m_pending;
    size_t m_writeCount{0};
    bool m_shutdown{false};

    // Serializes writers so an older snapshot never lands after a newer one
    std::mutex m_writeMutex;

    DebounceTimer m_timer;
};

} // namespace harbor::core::downloader
