/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "cache/TtlCache.hpp"
#include "downloader/DownloadScheduler.hpp"
#include "downloader/DownloadsState.hpp"
#include "downloader/HttpTransport.hpp"
#include "downloader/PersistenceGateway.hpp"
#include "downloader/SideEffects.hpp"
#include "downloader/TransferExecutor.hpp"
#include "storage/DurableStore.hpp"
#include "storage/FileStore.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/PathUtils.hpp"

#include <algorithm>
#include <chrono>

namespace harbor::core {

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing {} {}...", getName(), getVersion());

    auto startTime = std::chrono::steady_clock::now();

    if (!initializeStorage()) {
        Logger::instance().error("Failed to initialize storage");
        setState(AppState::Error);
        return false;
    }

    if (!initializeDownloader()) {
        Logger::instance().error("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    m_eventBus.emit("app.initialized");

    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    // Reverse order of construction
    m_downloads.reset();
    if (m_scheduler) {
        m_scheduler->shutdown();
    }
    m_scheduler.reset();
    m_gateway.reset();
    m_transport.reset();
    m_fileSystem.reset();
    m_store.reset();

    m_eventBus.emit("app.shutdown");
    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

downloader::DownloadsState& Application::getDownloads() const {
    return *m_downloads;
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

bool Application::initializeStorage() {
    auto& config = Config::instance();

    auto storeDir = config.get<std::string>("storage.directory", "");
    fs::path root = storeDir.empty() ? utils::PathUtils::getStorePath() : fs::path(storeDir);

    if (utils::FileUtils::createDirectories(root)) {
        m_store = std::make_shared<storage::FileStore>(root);
        Logger::instance().debug("Durable store at {}", root.string());
    } else {
        // Downloads still work; nothing survives the process
        Logger::instance().error("{}: cannot create {}, keeping state in memory only",
                                 downloader::errorCodeName(downloader::ErrorCode::PersistenceError),
                                 root.string());
        m_store = std::make_shared<storage::MemoryStore>();
    }

    m_fileSystem = std::make_shared<downloader::LocalFileSystem>();
    return true;
}

bool Application::initializeDownloader() {
    auto& config = Config::instance();

    try {
        cache::TtlCacheOptions cacheOptions;
        cacheOptions.ttl = std::chrono::seconds(config.get<int>("cache.ttlSeconds", 300));
        cacheOptions.maxEntries = config.get<size_t>("cache.maxEntries", 50);
        cacheOptions.keyPrefix = "cache.size.";
        auto sizeCache = std::make_shared<downloader::HttpTransport::SizeCache>(m_store, cacheOptions);

        downloader::HttpTransportOptions httpOptions;
        httpOptions.connectTimeoutMs = config.get<int>("downloads.connectTimeoutMs", 10000);
        httpOptions.lowSpeedLimit = config.get<int>("downloads.lowSpeedLimit", 1);
        httpOptions.lowSpeedTimeSeconds = config.get<int>("downloads.lowSpeedTimeSeconds", 60);
        httpOptions.userAgent = config.get<std::string>("downloads.userAgent", "Harbor/1.0");
        m_transport = std::make_shared<downloader::HttpTransport>(httpOptions, sizeCache);

        downloader::PersistenceOptions persistenceOptions;
        persistenceOptions.debounce = std::chrono::milliseconds(config.get<int>("persistence.debounceMs", 1000));
        persistenceOptions.key = config.get<std::string>("persistence.key", "downloads");
        m_gateway = std::make_shared<downloader::PersistenceGateway>(m_store, persistenceOptions);

        downloader::SchedulerOptions schedulerOptions;
        schedulerOptions.maxConcurrent = static_cast<size_t>(
            std::max(1, config.get<int>("downloads.maxConcurrent", 2)));
        auto directory = config.get<std::string>("downloads.directory", "");
        schedulerOptions.downloadDirectory = directory.empty()
            ? utils::PathUtils::getDownloadsPath().string()
            : directory;

        if (!m_fileSystem->createDirectories(schedulerOptions.downloadDirectory)) {
            Logger::instance().error("Cannot create download directory {}", schedulerOptions.downloadDirectory);
            return false;
        }

        auto executor = std::make_shared<downloader::TransferExecutor>(m_transport, m_fileSystem);
        m_scheduler = std::make_shared<downloader::DownloadScheduler>(
            executor, m_fileSystem, m_gateway, schedulerOptions);

        initializeSideEffects();

        m_scheduler->restore(m_gateway->load());
        size_t dropped = m_scheduler->validateAndCleanup();
        if (dropped > 0) {
            Logger::instance().info("Dropped {} completed download(s) with missing files", dropped);
        }

        m_downloads = std::make_unique<downloader::DownloadsState>(*m_scheduler);
        return true;

    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization error: {}", e.what());
        return false;
    }
}

void Application::initializeSideEffects() {
    auto& config = Config::instance();
    auto& sideEffects = m_scheduler->sideEffects();

    sideEffects.setNotifier(std::make_shared<downloader::EventBusNotifier>(m_eventBus));

    bool galleryEnabled = config.get<bool>("gallery.enabled", false);
    auto galleryDir = config.get<std::string>("gallery.directory", "");

    sideEffects.setPermissionGate(std::make_shared<downloader::StaticPermissionGate>(galleryEnabled));
    if (galleryEnabled && !galleryDir.empty()) {
        sideEffects.setGalleryExporter(
            std::make_shared<downloader::DirectoryGalleryExporter>(m_fileSystem, galleryDir));
        Logger::instance().info("Gallery export enabled: {}", galleryDir);
    }
}

} // namespace harbor::core
