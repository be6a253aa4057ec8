#pragma once

/**
 * Application.hpp
 *
 * Owns the lifecycle of the download core.
 * Builds every subsystem from Config, wires them together and tears
 * them down in reverse order.
 */

#include "EventBus.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace harbor::core::storage { class DurableStore; }
namespace harbor::core::downloader {
class DownloadScheduler;
class DownloadsState;
class HttpTransport;
class LocalFileSystem;
class PersistenceGateway;
}

namespace harbor::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * One instance per process, created by main() and passed to whoever
 * needs the scheduler. Several instances can coexist in tests as long
 * as they use different storage directories.
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all subsystems from Config::instance()
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Stop transfers, flush persisted state and release subsystems
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }
    bool isRunning() const { return m_state.load() == AppState::Ready; }

    EventBus& getEventBus() { return m_eventBus; }

    std::shared_ptr<downloader::DownloadScheduler> getScheduler() const { return m_scheduler; }

    /**
     * Query/control facade; valid between initialize() and shutdown()
     */
    downloader::DownloadsState& getDownloads() const;

    std::shared_ptr<storage::DurableStore> getStore() const { return m_store; }

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Harbor"; }

private:
    void setState(AppState state);

    bool initializeStorage();
    bool initializeDownloader();
    void initializeSideEffects();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    EventBus m_eventBus;

    std::shared_ptr<storage::DurableStore> m_store;
    std::shared_ptr<downloader::LocalFileSystem> m_fileSystem;
    std::shared_ptr<downloader::HttpTransport> m_transport;
    std::shared_ptr<downloader::PersistenceGateway> m_gateway;
    std::shared_ptr<downloader::DownloadScheduler> m_scheduler;
    std::unique_ptr<downloader::DownloadsState> m_downloads;
};

} // namespace harbor::core
