/**
 * @file Logger.hpp
 * @brief Logging infrastructure for CsrfGuard diagnostics
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 CsrfGuard. All rights reserved.
 *
 * One process-wide spdlog logger. The library itself only reports rejected
 * token text (Debug), logger setup (Info) and a missing random source
 * (Critical). Token values never reach a log line.
 */

#pragma once

#ifndef CSRFGUARD_CORE_LOGGER_HPP
#define CSRFGUARD_CORE_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace spdlog {
class logger;
}

namespace CsrfGuard {
namespace Core {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,      ///< Rejected token text
    Info = 2,       ///< Setup and lifecycle
    Warning = 3,
    Error = 4,
    Critical = 5,   ///< No usable random source
    Off = 255
};

/// Sink selection, combinable with |
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Colored stdout
    File = 1 << 1,      ///< Size-rotated file, 3 backups
    Callback = 1 << 2   ///< Handler set with Logger::SetCallback()
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * Receives each enabled record. Called with the logger locked, so it must
 * not log itself.
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Process-wide logger
 *
 * Silent until Initialize() succeeds. Anything logged while silent or
 * below the minimum level is counted in Statistics::dropped.
 */
class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Create the sinks and start logging
     * @param logFilePath Required when outputs include File; missing
     *        parent directories are created
     * @param maxFileSizeMB Rotation threshold of the file sink
     * @return false if already initialized, the file path is missing, the
     *         size is 0 or overflows a byte count, or a sink cannot be created
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /// Flush and drop the sinks; Initialize() may be called again
    void Shutdown();

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    void SetCallback(LogCallback callback);

    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @param file,line Source location, written as "(file:line)" ahead of
     *        the message when given
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /// printf-style variant of Log(); formatting is skipped for disabled levels
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) {
            Log(level, std::string_view{});
            return;
        }

        char buffer[512];
        const int length = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
        if (length < 0) {
            return;
        }

        if (static_cast<size_t>(length) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, static_cast<size_t>(length)));
            return;
        }

        std::string message(static_cast<size_t>(length) + 1, '\0');
        std::snprintf(message.data(), message.size(), format, std::forward<Args>(args)...);
        message.resize(static_cast<size_t>(length));
        Log(level, message);
    }

    void Flush();

    /// Per-level counts of written records
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool IsLevelEnabledLocked(LogLevel level) const;

    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;
    LogCallback callback_;

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace CsrfGuard

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef CSRFGUARD_DISABLE_LOGGING

#define CSRFGUARD_LOG_AT(level, msg) \
    ::CsrfGuard::Core::Logger::Instance().Log(::CsrfGuard::Core::LogLevel::level, msg, __FILE__, __LINE__)

#define CSRFGUARD_LOG_FORMAT_AT(level, fmt, ...) \
    ::CsrfGuard::Core::Logger::Instance().LogFormat(::CsrfGuard::Core::LogLevel::level, fmt, __VA_ARGS__)

#else
#define CSRFGUARD_LOG_AT(level, msg) ((void)0)
#define CSRFGUARD_LOG_FORMAT_AT(level, fmt, ...) ((void)0)
#endif // CSRFGUARD_DISABLE_LOGGING

#define CSRFGUARD_LOG_DEBUG(msg)    CSRFGUARD_LOG_AT(Debug, msg)
#define CSRFGUARD_LOG_INFO(msg)     CSRFGUARD_LOG_AT(Info, msg)
#define CSRFGUARD_LOG_ERROR(msg)    CSRFGUARD_LOG_AT(Error, msg)
#define CSRFGUARD_LOG_CRITICAL(msg) CSRFGUARD_LOG_AT(Critical, msg)

#define CSRFGUARD_LOG_DEBUG_F(fmt, ...)    CSRFGUARD_LOG_FORMAT_AT(Debug, fmt, __VA_ARGS__)
#define CSRFGUARD_LOG_INFO_F(fmt, ...)     CSRFGUARD_LOG_FORMAT_AT(Info, fmt, __VA_ARGS__)
#define CSRFGUARD_LOG_CRITICAL_F(fmt, ...) CSRFGUARD_LOG_FORMAT_AT(Critical, fmt, __VA_ARGS__)

#endif // CSRFGUARD_CORE_LOGGER_HPP
