/**
 * TransferExecutor.cpp
 */

#include "TransferExecutor.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace harbor::core::downloader {

// -- TransferControl --

void TransferControl::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paused = true;
}

void TransferControl::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_paused = false;
    }
    m_condition.notify_all();
}

void TransferControl::abort() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_aborted = true;
    }
    m_condition.notify_all();
}

bool TransferControl::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

bool TransferControl::commit(const std::function<bool()>& publish) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_aborted.load()) {
        return false;
    }
    m_committed = publish();
    return true;
}

bool TransferControl::isCommitted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_committed;
}

bool TransferControl::waitWhilePaused() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return !m_paused || m_aborted.load(); });
    return !m_aborted.load();
}

// -- TransferExecutor --

namespace {

/**
 * Bridges transport callbacks to the output file and the event sink
 */
class ExecutorObserver : public TransportObserver {
public:
    ExecutorObserver(ChunkWriter& writer, TransferControl& control,
                     const TransferEventSink& sink, uint64_t expectedTotal)
        : m_writer(writer), m_control(control), m_sink(sink), m_total(expectedTotal) {}

    bool onData(const char* data, size_t size) override {
        if (!m_control.waitWhilePaused()) {
            return false;
        }
        if (size == 0) {
            return true;
        }
        if (!m_writer.writeChunk(data, size)) {
            m_writeFailed = true;
            return false;
        }
        m_written += size;
        m_total = std::max(m_total, m_written);
        emitProgress();
        return !m_control.isAborted();
    }

    bool onProgress(uint64_t /*bytesReceived*/, uint64_t bytesTotal) override {
        if (!m_control.waitWhilePaused()) {
            return false;
        }
        if (bytesTotal > m_total) {
            m_total = bytesTotal;
            emitProgress();
        }
        return !m_control.isAborted();
    }

    uint64_t written() const { return m_written; }
    uint64_t total() const { return m_total; }
    bool writeFailed() const { return m_writeFailed; }

private:
    void emitProgress() {
        m_sink(TransferEvent{TransferEventType::Progress, m_written, m_total, {}});
    }

    ChunkWriter& m_writer;
    TransferControl& m_control;
    const TransferEventSink& m_sink;
    uint64_t m_written{0};
    uint64_t m_total{0};
    bool m_writeFailed{false};
};

} // namespace

TransferExecutor::TransferExecutor(std::shared_ptr<NetworkTransport> transport,
                                   std::shared_ptr<FileSystem> fileSystem)
    : m_transport(std::move(transport))
    , m_fileSystem(std::move(fileSystem)) {
}

void TransferExecutor::run(const TransferRequest& request, TransferControl& control,
                           const TransferEventSink& sink) const {
    const std::string partialPath = request.outputPath();

    auto fail = [&](const std::string& error, uint64_t written, uint64_t total) {
        Logger::instance().warn("Transfer {} failed: {}", request.id, error);
        m_fileSystem->deleteFile(partialPath);
        sink(TransferEvent{TransferEventType::Failed, written, total, error});
    };

    auto aborted = [&](uint64_t written, uint64_t total) {
        m_fileSystem->deleteFile(partialPath);
        Logger::instance().debug("Transfer {} aborted, partial output discarded", request.id);
        sink(TransferEvent{TransferEventType::Aborted, written, total, {}});
    };

    if (control.isAborted()) {
        sink(TransferEvent{TransferEventType::Aborted, 0, 0, {}});
        return;
    }

    uint64_t expectedTotal = 0;
    try {
        expectedTotal = m_transport->probeSize(request.sourceUrl).value_or(0);

        auto writer = m_fileSystem->openWriter(partialPath);
        if (!writer) {
            fail("Failed to open output file " + partialPath, 0, expectedTotal);
            return;
        }

        ExecutorObserver observer(*writer, control, sink, expectedTotal);
        Logger::instance().debug("Transfer {} started: {} -> {}",
                                 request.id, request.sourceUrl, request.destinationPath);

        TransportResult result = m_transport->fetch(request.sourceUrl, observer);
        bool closed = writer->close();
        writer.reset();

        if (control.isAborted()) {
            aborted(observer.written(), observer.total());
            return;
        }
        if (observer.writeFailed() || !closed) {
            fail("Failed to write " + partialPath, observer.written(), observer.total());
            return;
        }
        if (!result.success) {
            std::string error = result.error.empty()
                ? "HTTP " + std::to_string(result.statusCode)
                : result.error;
            fail(error, observer.written(), observer.total());
            return;
        }

        // Only a run that was not aborted may touch the destination
        bool moved = false;
        bool committed = control.commit([&] {
            moved = m_fileSystem->moveFile(partialPath, request.destinationPath);
            return moved;
        });
        if (!committed) {
            aborted(observer.written(), observer.total());
            return;
        }
        if (!moved) {
            fail("Failed to move output into " + request.destinationPath,
                 observer.written(), observer.total());
            return;
        }

        uint64_t finalSize = m_fileSystem->stat(request.destinationPath).value_or(observer.written());
        Logger::instance().debug("Transfer {} finished ({} bytes)", request.id, finalSize);
        sink(TransferEvent{TransferEventType::Completed, finalSize, finalSize, {}});

    } catch (const std::exception& e) {
        if (control.isAborted()) {
            aborted(0, expectedTotal);
        } else {
            fail(e.what(), 0, expectedTotal);
        }
    }
}

} // namespace harbor::core::downloader
