/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 CsrfGuard. All rights reserved.
 *
 * Sinks are spdlog's thread-safe (_mt) console, rotating file and
 * callback sinks behind a single synchronous logger.
 */

#include "CsrfGuard/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/base_sink.h>
#include <filesystem>
#include <iostream>
#include <limits>
#include <vector>

namespace CsrfGuard {
namespace Core {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        default:                      return LogLevel::Off;
    }
}

/**
 * Forwards formatted records to a handler. Runs under the logger's
 * mutex, so the handler must not log.
 */
class CallbackSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    using Handler = std::function<void(const spdlog::details::log_msg&)>;

    explicit CallbackSink(Handler handler) : handler_(std::move(handler)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        handler_(msg);
    }

    void flush_() override {}

private:
    Handler handler_;
};

const char* BaseName(const char* path) {
    const char* name = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            name = p + 1;
        }
    }
    return name;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    if (hasFlag(outputs, LogOutput::File) && logFilePath.empty()) {
        return false;
    }

    constexpr size_t bytesPerMB = 1024 * 1024;
    if (maxFileSizeMB == 0 || maxFileSizeMB > std::numeric_limits<size_t>::max() / bytesPerMB) {
        return false;
    }

    minLevel_ = minLevel;
    outputs_ = outputs;
    logFilePath_ = logFilePath;
    maxFileSizeBytes_ = maxFileSizeMB * bytesPerMB;

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs_, LogOutput::Console)) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        if (hasFlag(outputs_, LogOutput::File)) {
            std::filesystem::path logPath(logFilePath_);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }

            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath_,
                maxFileSizeBytes_,
                3 // rotated files kept
            ));
        }

        if (hasFlag(outputs_, LogOutput::Callback)) {
            // callback_ is read under mutex_, which Log() already holds
            sinks.push_back(std::make_shared<CallbackSink>(
                [this](const spdlog::details::log_msg& msg) {
                    if (callback_) {
                        callback_(FromSpdlogLevel(msg.level),
                                  std::string_view(msg.payload.data(), msg.payload.size()),
                                  msg.time);
                    }
                }
            ));
        }

        spdlogger_ = std::make_shared<spdlog::logger>("csrfguard", sinks.begin(), sinks.end());
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlogger_->set_level(ToSpdlogLevel(minLevel_));
        spdlogger_->flush_on(spdlog::level::warn);

        initialized_ = true;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        spdlogger_.reset();
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }

    initialized_ = false;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return IsLevelEnabledLocked(level);
}

bool Logger::IsLevelEnabledLocked(LogLevel level) const {
    return initialized_ && level != LogLevel::Off && level >= minLevel_;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!IsLevelEnabledLocked(level) || !spdlogger_) {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        stats_.dropped++;
        return;
    }

    {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            case LogLevel::Off:      break;
        }
    }

    if (file && line > 0) {
        spdlogger_->log(ToSpdlogLevel(level), "({}:{}) {}", BaseName(file), line, message);
    } else {
        spdlogger_->log(ToSpdlogLevel(level), "{}", message);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

} // namespace Core
} // namespace CsrfGuard
