#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the download core.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace harbor::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Output goes to a colored console sink and a rotating file sink.
 * Until initialize() is called every log call is a no-op, so library
 * code and unit tests can log without any setup.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (optional)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            std::filesystem::path logPath;
            if (logDir.empty()) {
                logPath = std::filesystem::current_path() / "logs" / "harbor.log";
            } else {
                logPath = std::filesystem::path(logDir) / "harbor.log";
            }

            std::filesystem::create_directories(logPath.parent_path());

            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(),
                1024 * 1024 * 10, // 10 MB
                5,                // 5 rotated files
                true              // Rotate on open
            );
            fileSink->set_level(spdlog::level::trace);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);

            m_logger = std::make_shared<spdlog::logger>("harbor", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));

        } catch (const std::exception& ex) {
            // Log directory not writable: console only
            m_logger = spdlog::stdout_color_mt("harbor_fallback");
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Parse a level name as written in the config file
     * @param name "trace", "debug", "info", "warn", "error", "critical" or "off"
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return fallback;
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace harbor::core

// Convenience macros
#define LOG_TRACE(...)    harbor::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    harbor::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     harbor::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     harbor::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    harbor::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) harbor::core::Logger::instance().critical(__VA_ARGS__)
