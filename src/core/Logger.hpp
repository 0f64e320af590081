#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the orchestrator and its download workers.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/fmt/ostr.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace modeld::core {

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
 * Sinks:
 * - Console output with colors
 * - Rotating file output (modeld.log)
 *
 * Forked download workers call detachForChild() so they never touch
 * the parent's sinks or the rotating file.
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
     * @param logDir Log file directory (empty = ./logs)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        m_level = level;
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            std::filesystem::path logPath;
            if (logDir.empty()) {
                logPath = std::filesystem::current_path() / "logs" / "modeld.log";
            } else {
                logPath = std::filesystem::path(logDir) / "modeld.log";
            }

            std::filesystem::create_directories(logPath.parent_path());

            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(),
                1024 * 1024 * 10, // 10 MB
                5,                // 5 rotated files
                false
            );
            fileSink->set_level(spdlog::level::trace);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%P:%t] %v");
            sinks.push_back(fileSink);

            m_logger = std::make_shared<spdlog::logger>("modeld", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));

            m_initialized = true;

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = spdlog::stdout_color_mt("modeld_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }

    /**
     * Replace the sinks inherited across fork() with a private stderr sink.
     *
     * Locks held by other parent threads at fork time are never released
     * in the child, so the inherited logger must not be used there. The
     * _mt console sinks all share one process-wide mutex; the child has a
     * single thread and takes the lock-free _st sink instead.
     * @param tag Prefix identifying the worker (usually the work item id)
     */
    void detachForChild(const std::string& tag) {
        if (!m_logger) {
            return;
        }
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_st>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [worker " + tag + " pid %P] %v");

        auto child = std::make_shared<spdlog::logger>("modeld_worker", sink);
        child->set_level(toSpdlogLevel(m_level));
        child->flush_on(spdlog::level::info);
        m_logger = std::move(child);
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        m_level = level;
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

    bool isInitialized() const { return m_initialized; }

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
    LogLevel m_level{LogLevel::Info};
    bool m_initialized{false};
};

} // namespace modeld::core

// Convenience macros
#define LOG_TRACE(...)    modeld::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    modeld::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     modeld::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     modeld::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    modeld::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) modeld::core::Logger::instance().critical(__VA_ARGS__)
