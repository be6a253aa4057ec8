/**
 * Harbor - bounded-concurrency download manager
 *
 * Command line entry point.
 * Enqueues the given URLs, reports progress until the queue drains and
 * prints a summary.
 *
 * @version 1.0.0
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadScheduler.hpp"
#include "core/downloader/DownloadsState.hpp"
#include "utils/FileUtils.hpp"
#include "utils/PathUtils.hpp"

namespace {

using namespace harbor;

std::atomic<bool> g_interrupted{false};

/**
 * Signal handler: only flags the main loop, which does the shutdown
 */
void signalHandler(int) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct Options {
    bool debug{false};
    bool list{false};
    std::string configPath;
    std::string outputDir;
    int jobs{0};
    std::vector<std::string> urls;
};

void printUsage(const char* program) {
    std::cout << "Harbor - download manager\n"
              << "\nUsage: " << program << " [options] <url>...\n"
              << "       " << program << " [options] list\n"
              << "\nOptions:\n"
              << "  -c, --config <file>  Configuration file\n"
              << "  -o, --output <dir>   Download directory\n"
              << "  -j, --jobs <n>       Maximum concurrent downloads\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * @return Exit code to return immediately, or -1 to continue
 */
int parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto needValue = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << core::Application::getName() << " v" << core::Application::getVersion() << std::endl;
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            const char* value = needValue(arg);
            if (!value) return 2;
            options.configPath = value;
        } else if (arg == "--output" || arg == "-o") {
            const char* value = needValue(arg);
            if (!value) return 2;
            options.outputDir = value;
        } else if (arg == "--jobs" || arg == "-j") {
            const char* value = needValue(arg);
            if (!value) return 2;
            options.jobs = std::atoi(value);
            if (options.jobs <= 0) {
                std::cerr << "Invalid job count: " << value << std::endl;
                return 2;
            }
        } else if (arg == "list" && options.urls.empty()) {
            options.list = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            options.urls.push_back(arg);
        }
    }

    if (!options.list && options.urls.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    return -1;
}

/**
 * Load the configuration file, creating it with defaults on first run
 */
bool loadConfiguration(const Options& options) {
    auto& config = core::Config::instance();

    if (!options.configPath.empty()) {
        if (!config.load(options.configPath)) {
            std::cerr << "Cannot read configuration " << options.configPath << std::endl;
            return false;
        }
    } else {
        auto configPath = utils::PathUtils::getConfigPath();
        if (utils::FileUtils::fileExists(configPath)) {
            if (!config.load(configPath.string())) {
                std::cerr << "Ignoring unreadable configuration " << configPath.string() << std::endl;
            }
        } else if (!config.save(configPath.string())) {
            std::cerr << "Cannot write default configuration to " << configPath.string() << std::endl;
        }
    }

    if (!options.outputDir.empty()) {
        config.set("downloads.directory", options.outputDir);
    }
    if (options.jobs > 0) {
        config.set("downloads.maxConcurrent", options.jobs);
    }
    return true;
}

std::string formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), unit == 0 ? "%.0f %s" : "%.1f %s", value, units[unit]);
    return buffer;
}

void printItems(const std::vector<core::downloader::DownloadItem>& items) {
    if (items.empty()) {
        std::cout << "No downloads." << std::endl;
        return;
    }

    for (const auto& item : items) {
        char line[64];
        std::snprintf(line, sizeof(line), "%-11s %5.1f%% %10s  ",
                      core::downloader::statusName(item.status),
                      item.progress * 100.0,
                      formatBytes(item.sizeBytes).c_str());
        std::cout << line << item.id << "  " << item.displayTitle;
        if (item.failure) {
            std::cout << "  (" << item.failure->message << ")";
        }
        std::cout << "\n";
    }
    std::cout << std::flush;
}

void subscribeToProgress(core::EventBus& bus) {
    auto& logger = core::Logger::instance();

    bus.subscribe("download.started", [&logger](const core::json& data) {
        logger.info("[{}] started", data.value("id", ""));
    });
    bus.subscribe("download.progress", [&logger](const core::json& data) {
        logger.info("[{}] {:.0f}%", data.value("id", ""), data.value("progress", 0.0) * 100.0);
    });
    bus.subscribe("download.completed", [&logger](const core::json& data) {
        logger.info("[{}] completed -> {}", data.value("id", ""), data.value("destinationPath", ""));
    });
    bus.subscribe("download.failed", [&logger](const core::json& data) {
        logger.error("[{}] failed: {}", data.value("id", ""), data.value("error", ""));
    });
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;
    int exitCode = parseArguments(argc, argv, options);
    if (exitCode >= 0) {
        return exitCode;
    }

    if (!loadConfiguration(options)) {
        return 1;
    }

    auto& config = core::Config::instance();
    auto level = core::Logger::parseLevel(config.get<std::string>("log.level", "info"));
    core::Logger::instance().initialize(options.debug ? core::LogLevel::Debug : level,
                                        utils::PathUtils::getLogsPath().string());

    auto& logger = core::Logger::instance();
    logger.debug("{} v{} starting...", core::Application::getName(), core::Application::getVersion());

    setupSignalHandlers();

    try {
        core::Application app;
        if (!app.initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        auto& downloads = app.getDownloads();

        if (options.list) {
            printItems(downloads.all());
            std::cout << "Storage used: " << formatBytes(downloads.totalBytesUsed()) << std::endl;
            app.shutdown();
            return 0;
        }

        subscribeToProgress(app.getEventBus());

        std::vector<std::string> ids;
        for (const auto& url : options.urls) {
            core::downloader::DownloadRequest request;
            request.sourceUrl = url;
            if (auto id = downloads.startDownload(request)) {
                ids.push_back(*id);
            }
        }

        auto scheduler = app.getScheduler();
        while (!g_interrupted && !scheduler->waitForIdle(std::chrono::milliseconds(200))) {
        }

        if (g_interrupted) {
            logger.warn("Interrupted, stopping {} transfer(s)", scheduler->activeCount());
        }

        size_t completed = 0;
        std::vector<core::downloader::DownloadItem> finished;
        for (const auto& id : ids) {
            if (auto item = downloads.byId(id)) {
                if (item->status == core::downloader::DownloadStatus::Completed) {
                    ++completed;
                }
                finished.push_back(*item);
            }
        }

        app.shutdown();

        printItems(finished);
        std::cout << completed << " of " << options.urls.size() << " download(s) completed" << std::endl;
        return completed == options.urls.size() ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
