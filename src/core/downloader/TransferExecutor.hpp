#pragma once

/**
 * TransferExecutor.hpp
 *
 * Runs one transfer for one item and reports it as a finite sequence of
 * events ending in exactly one terminal event.
 */

#include "FileSystem.hpp"
#include "NetworkTransport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace harbor::core::downloader {

/**
 * TransferControl - pause/resume/abort signals for one running transfer
 *
 * Signals are advisory: the executor observes them the next time the
 * transport calls back into it.
 */
class TransferControl {
public:
    void pause();
    void resume();
    void abort();

    bool isPaused() const;
    bool isAborted() const { return m_aborted.load(); }

    /**
     * Run publish unless aborted. abort() waits for a publish in progress,
     * so once abort() returns isCommitted() is final.
     * @return false if the transfer was aborted first
     */
    bool commit(const std::function<bool()>& publish);

    bool isCommitted() const;

    /**
     * Block while paused
     * @return false once aborted
     */
    bool waitWhilePaused();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_paused{false};
    bool m_committed{false};
    std::atomic<bool> m_aborted{false};
};

enum class TransferEventType {
    Progress,
    Completed,
    Failed,
    Aborted
};

struct TransferEvent {
    TransferEventType type{TransferEventType::Progress};

    // Non-decreasing across the Progress events of one run
    uint64_t bytesWritten{0};

    // 0 while unknown; final size on Completed
    uint64_t bytesTotal{0};

    std::string error;

    bool isTerminal() const { return type != TransferEventType::Progress; }
};

using TransferEventSink = std::function<void(const TransferEvent&)>;

struct TransferRequest {
    std::string id;
    std::string sourceUrl;
    std::string destinationPath;

    // Written during the run and renamed to destinationPath on success.
    // Defaults to destinationPath + ".part".
    std::string partialPath;

    std::string outputPath() const {
        return partialPath.empty() ? destinationPath + ".part" : partialPath;
    }
};

/**
 * TransferExecutor
 *
 * Stateless apart from its collaborators, so one instance serves every
 * concurrent transfer.
 */
class TransferExecutor {
public:
    TransferExecutor(std::shared_ptr<NetworkTransport> transport,
                     std::shared_ptr<FileSystem> fileSystem);

    /**
     * Perform the transfer on the calling thread
     * @param request What to fetch and where to write it
     * @param control Signals from the scheduler
     * @param sink Receives progress and the single terminal event
     */
    void run(const TransferRequest& request, TransferControl& control,
             const TransferEventSink& sink) const;

private:
    std::shared_ptr<NetworkTransport> m_transport;
    std::shared_ptr<FileSystem> m_fileSystem;
};

} // namespace harbor::core::downloader
