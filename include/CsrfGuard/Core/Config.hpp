/**
 * @file Config.hpp
 * @brief Settings file loading for CsrfGuard
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * The token types themselves take no configuration. This module reads the
 * key=value settings file an embedding service uses to set up CsrfGuard's
 * diagnostics, with protection against:
 * - Path traversal outside an allowed directory
 * - Symlink substitution of the final path component
 * - Oversized files
 */

#pragma once

#ifndef CSRFGUARD_CORE_CONFIG_HPP
#define CSRFGUARD_CORE_CONFIG_HPP

#include <CsrfGuard/Core/Types.hpp>
#include <CsrfGuard/Core/ErrorCodes.hpp>
#include <CsrfGuard/Core/Logger.hpp>
#include <map>
#include <memory>
#include <string>

namespace CsrfGuard::Config {

using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief Key=value settings loader
 *
 * Lines starting with '#' or ';' are comments. Keys and values are
 * whitespace-trimmed; a later duplicate key replaces an earlier one.
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 64 * 1024;
        std::string allowed_directory;       ///< Restrict to directory (empty: no restriction)
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration, or FileNotFound, FileTooLarge,
     *         InvalidPath, AccessDenied, IOError, ConfigParseFailed
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration from memory
     * @return Parsed configuration, or ConfigParseFailed for a line that
     *         is neither a comment nor key=value, or has an empty key
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Logging Settings
// ============================================================================

/**
 * @brief Logger setup read from the settings file
 *
 * | key                   | values                                          |
 * |-----------------------|-------------------------------------------------|
 * | log.level             | trace, debug, info, warning, error, critical, off |
 * | log.console           | true / false                                    |
 * | log.file              | path of the rotating log file (enables File)    |
 * | log.max_file_size_mb  | integer, 1 to MAX_FILE_SIZE_MB                   |
 */
struct LoggingSettings {
    static constexpr size_t MAX_FILE_SIZE_MB = 1024;

    Core::LogLevel level = Core::LogLevel::Info;
    Core::LogOutput outputs = Core::LogOutput::Console;
    std::string file;
    size_t max_file_size_mb = 10;
};

/**
 * @brief Extract logging settings, keeping defaults for missing keys
 * @return settings or ConfigInvalid for an unrecognized value
 */
Result<LoggingSettings> parseLoggingSettings(const ConfigMap& config);

/**
 * @brief Initialize the global Logger from settings
 * @return ConfigInvalid if the logger could not be initialized
 */
Result<void> applyLoggingSettings(const LoggingSettings& settings);

} // namespace CsrfGuard::Config

#endif // CSRFGUARD_CORE_CONFIG_HPP
