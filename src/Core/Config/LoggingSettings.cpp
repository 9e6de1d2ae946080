/**
 * @file LoggingSettings.cpp
 * @brief Logger setup from the settings file
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Core/Config.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace CsrfGuard::Config {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<Core::LogLevel> parseLevel(const std::string& text) {
    const std::string name = toLower(text);

    if (name == "trace")    return Core::LogLevel::Trace;
    if (name == "debug")    return Core::LogLevel::Debug;
    if (name == "info")     return Core::LogLevel::Info;
    if (name == "warning" || name == "warn") return Core::LogLevel::Warning;
    if (name == "error")    return Core::LogLevel::Error;
    if (name == "critical") return Core::LogLevel::Critical;
    if (name == "off")      return Core::LogLevel::Off;

    return ErrorCode::ConfigInvalid;
}

Result<bool> parseBool(const std::string& text) {
    const std::string value = toLower(text);

    if (value == "true" || value == "yes" || value == "on" || value == "1")  return true;
    if (value == "false" || value == "no" || value == "off" || value == "0") return false;

    return ErrorCode::ConfigInvalid;
}

Result<size_t> parseFileSizeMB(const std::string& text) {
    size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last ||
        value == 0 || value > LoggingSettings::MAX_FILE_SIZE_MB) {
        return ErrorCode::ConfigInvalid;
    }

    return value;
}

} // namespace

Result<LoggingSettings> parseLoggingSettings(const ConfigMap& config) {
    LoggingSettings settings;

    if (auto it = config.find("log.level"); it != config.end()) {
        auto level = parseLevel(it->second);
        if (level.isFailure()) {
            return level.error();
        }
        settings.level = level.value();
    }

    bool console = true;
    if (auto it = config.find("log.console"); it != config.end()) {
        auto flag = parseBool(it->second);
        if (flag.isFailure()) {
            return flag.error();
        }
        console = flag.value();
    }

    if (auto it = config.find("log.file"); it != config.end()) {
        settings.file = it->second;
    }

    if (auto it = config.find("log.max_file_size_mb"); it != config.end()) {
        auto size = parseFileSizeMB(it->second);
        if (size.isFailure()) {
            return size.error();
        }
        settings.max_file_size_mb = size.value();
    }

    settings.outputs = console ? Core::LogOutput::Console : Core::LogOutput::None;
    if (!settings.file.empty()) {
        settings.outputs = settings.outputs | Core::LogOutput::File;
    }

    return settings;
}

Result<void> applyLoggingSettings(const LoggingSettings& settings) {
    auto& logger = Core::Logger::Instance();

    if (!logger.Initialize(settings.level, settings.outputs,
                           settings.file, settings.max_file_size_mb)) {
        return ErrorCode::ConfigInvalid;
    }

    CSRFGUARD_LOG_INFO_F("CsrfGuard %s logging initialized", VERSION_STRING);
    return Result<void>::Success();
}

} // namespace CsrfGuard::Config
