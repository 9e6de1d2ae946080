/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the settings loader and logging settings
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * Tests settings loading to ensure:
 * - Path traversal blocked
 * - Size limits enforced
 * - Malformed lines rejected
 * - Logging settings validated before the logger is touched
 */

#include <CsrfGuard/Core/Config.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace CsrfGuard;
using namespace CsrfGuard::Config;
using namespace CsrfGuard::Testing;

namespace fs = std::filesystem;

namespace {

ByteBuffer textBytes(const std::string& text) {
    return ByteBuffer(text.begin(), text.end());
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() / "csrfguard_config_test";
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        if (fs::exists(tempDir)) {
            fs::remove_all(tempDir);
        }
    }

    std::string createTestConfig(const std::string& filename, const std::string& content) {
        fs::path filepath = tempDir / filename;
        std::ofstream file(filepath);
        file << content;
        file.close();
        return filepath.string();
    }

    std::string createLargeFile(const std::string& filename, size_t sizeBytes) {
        fs::path filepath = tempDir / filename;
        std::ofstream file(filepath, std::ios::binary);
        std::vector<char> buffer(sizeBytes, 'A');
        file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        file.close();
        return filepath.string();
    }

    fs::path tempDir;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigLoaderTest, BasicLoad) {
    std::string configPath = createTestConfig("csrfguard.conf",
        "# CsrfGuard settings\n"
        "log.level=debug\n"
        "log.console = false\n"
        "log.max_file_size_mb=5\n");

    ConfigLoader loader;
    auto result = loader.load(configPath);

    ASSERT_RESULT_OK(result);

    const ConfigMap& config = result.value();
    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config.at("log.level"), "debug");
    EXPECT_EQ(config.at("log.console"), "false");
    EXPECT_EQ(config.at("log.max_file_size_mb"), "5");
}

TEST_F(ConfigLoaderTest, MissingFile_ReportsFileNotFound) {
    ConfigLoader loader;

    EXPECT_RESULT_ERROR(loader.load((tempDir / "absent.conf").string()), ErrorCode::FileNotFound);
}

TEST_F(ConfigLoaderTest, PathTraversalBlocked) {
    ConfigLoader::Options options;
    options.allowed_directory = tempDir.string();

    ConfigLoader loader(options);

    std::string traversalPath = (tempDir / ".." / "etc" / "passwd").string();
    auto result = loader.load(traversalPath);

    ASSERT_TRUE(result.isFailure());
    EXPECT_TRUE(result.error() == ErrorCode::AccessDenied ||
                result.error() == ErrorCode::FileNotFound ||
                result.error() == ErrorCode::InvalidPath)
        << "Got: " << getErrorMessage(result.error());
}

TEST_F(ConfigLoaderTest, SizeLimit) {
    ConfigLoader::Options options;
    options.max_file_size = 1024;

    ConfigLoader loader(options);

    std::string largePath = createLargeFile("large.conf", 2048);

    EXPECT_RESULT_ERROR(loader.load(largePath), ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, DirectoryRestriction) {
    fs::path subDir = tempDir / "allowed";
    fs::create_directories(subDir);

    std::string allowedPath = createTestConfig("allowed/test.conf", "key=value\n");
    std::string deniedPath = createTestConfig("denied.conf", "key=value\n");

    ConfigLoader::Options options;
    options.allowed_directory = subDir.string();

    ConfigLoader loader(options);

    auto allowedResult = loader.load(allowedPath);
    ASSERT_RESULT_OK(allowedResult);

    EXPECT_RESULT_ERROR(loader.load(deniedPath), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, SiblingWithSharedPrefix_IsDenied) {
    fs::create_directories(tempDir / "allowed");
    fs::create_directories(tempDir / "allowed_not");

    std::string siblingPath = createTestConfig("allowed_not/test.conf", "key=value\n");

    ConfigLoader::Options options;
    options.allowed_directory = (tempDir / "allowed").string();

    ConfigLoader loader(options);

    EXPECT_RESULT_ERROR(loader.load(siblingPath), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, Directory_IsNotAConfigFile) {
    ConfigLoader loader;

    EXPECT_RESULT_ERROR(loader.load(tempDir.string()), ErrorCode::InvalidPath);
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, LoadFromMemory) {
    ConfigLoader loader;

    auto result = loader.loadFromMemory(textBytes("key1=value1\nkey2=value2\n"));

    ASSERT_RESULT_OK(result);
    EXPECT_EQ(result.value().at("key1"), "value1");
    EXPECT_EQ(result.value().at("key2"), "value2");
}

TEST_F(ConfigLoaderTest, EmptyInput_YieldsEmptyMap) {
    ConfigLoader loader;

    auto result = loader.loadFromMemory(ByteSpan{});

    ASSERT_RESULT_OK(result);
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ConfigLoaderTest, CommentsAndWhitespace_AreIgnored) {
    ConfigLoader loader;

    auto result = loader.loadFromMemory(textBytes(
        "\n"
        "   # comment\n"
        "; another comment\r\n"
        "\t key \t=  spaced value  \r\n"
        "empty=\n"
        "url=a=b\n"));

    ASSERT_RESULT_OK(result);
    const ConfigMap& config = result.value();
    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config.at("key"), "spaced value");
    EXPECT_EQ(config.at("empty"), "");
    EXPECT_EQ(config.at("url"), "a=b");
}

TEST_F(ConfigLoaderTest, DuplicateKey_LastWins) {
    ConfigLoader loader;

    auto result = loader.loadFromMemory(textBytes("log.level=info\nlog.level=error\n"));

    ASSERT_RESULT_OK(result);
    EXPECT_EQ(result.value().at("log.level"), "error");
}

TEST_F(ConfigLoaderTest, MalformedLine_Fails) {
    ConfigLoader loader;

    EXPECT_RESULT_ERROR(loader.loadFromMemory(textBytes("key=value\njust a line\n")),
                        ErrorCode::ConfigParseFailed);
    EXPECT_RESULT_ERROR(loader.loadFromMemory(textBytes("=value\n")),
                        ErrorCode::ConfigParseFailed);
}

TEST_F(ConfigLoaderTest, LoadFromMemory_SizeLimit) {
    ConfigLoader::Options options;
    options.max_file_size = 8;

    ConfigLoader loader(options);

    EXPECT_RESULT_ERROR(loader.loadFromMemory(textBytes("key=a long value\n")),
                        ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, DefaultOptions_Allow64KiB) {
    ConfigLoader loader;

    std::string atLimit = "# " + std::string(64 * 1024 - 3, 'x') + "\n";
    ASSERT_EQ(atLimit.size(), 64u * 1024u);
    auto result = loader.loadFromMemory(textBytes(atLimit));
    ASSERT_RESULT_OK(result);
    EXPECT_TRUE(result.value().empty());

    EXPECT_RESULT_ERROR(loader.loadFromMemory(textBytes(atLimit + "k")), ErrorCode::FileTooLarge);
}

// ============================================================================
// Logging Settings
// ============================================================================

TEST(LoggingSettings, EmptyConfig_KeepsDefaults) {
    auto result = parseLoggingSettings(ConfigMap{});

    ASSERT_RESULT_OK(result);
    const auto& settings = result.value();
    EXPECT_EQ(settings.level, Core::LogLevel::Info);
    EXPECT_EQ(settings.outputs, Core::LogOutput::Console);
    EXPECT_TRUE(settings.file.empty());
    EXPECT_EQ(settings.max_file_size_mb, 10u);
}

TEST(LoggingSettings, AllKeys_Parsed) {
    ConfigMap config{
        {"log.level", "WARNING"},
        {"log.console", "no"},
        {"log.file", "/var/log/csrfguard.log"},
        {"log.max_file_size_mb", "25"},
    };

    auto result = parseLoggingSettings(config);

    ASSERT_RESULT_OK(result);
    const auto& settings = result.value();
    EXPECT_EQ(settings.level, Core::LogLevel::Warning);
    EXPECT_EQ(settings.outputs, Core::LogOutput::File);
    EXPECT_EQ(settings.file, "/var/log/csrfguard.log");
    EXPECT_EQ(settings.max_file_size_mb, 25u);
}

TEST(LoggingSettings, ConsoleAndFile_Combined) {
    auto result = parseLoggingSettings({{"log.file", "csrf.log"}});

    ASSERT_RESULT_OK(result);
    EXPECT_TRUE(Core::hasFlag(result.value().outputs, Core::LogOutput::Console));
    EXPECT_TRUE(Core::hasFlag(result.value().outputs, Core::LogOutput::File));
}

TEST(LoggingSettings, LevelNames) {
    const std::vector<std::pair<std::string, Core::LogLevel>> cases = {
        {"trace", Core::LogLevel::Trace},
        {"Debug", Core::LogLevel::Debug},
        {"info", Core::LogLevel::Info},
        {"warn", Core::LogLevel::Warning},
        {"error", Core::LogLevel::Error},
        {"CRITICAL", Core::LogLevel::Critical},
        {"off", Core::LogLevel::Off},
    };

    for (const auto& [name, level] : cases) {
        auto result = parseLoggingSettings({{"log.level", name}});
        ASSERT_RESULT_OK(result);
        EXPECT_EQ(result.value().level, level) << "for '" << name << "'";
    }
}

TEST(LoggingSettings, InvalidValues_Rejected) {
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.level", "verbose"}}), ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.console", "maybe"}}), ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.max_file_size_mb", "0"}}), ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.max_file_size_mb", "-3"}}), ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.max_file_size_mb", "10MB"}}), ErrorCode::ConfigInvalid);
}

TEST(LoggingSettings, MaxFileSize_CappedAt1024MB) {
    auto largest = parseLoggingSettings({{"log.max_file_size_mb", "1024"}});
    ASSERT_RESULT_OK(largest);
    EXPECT_EQ(largest.value().max_file_size_mb, LoggingSettings::MAX_FILE_SIZE_MB);

    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.max_file_size_mb", "1025"}}), ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.max_file_size_mb", "18446744073709551615"}}),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(parseLoggingSettings({{"log.max_file_size_mb", "99999999999999999999999"}}),
                        ErrorCode::ConfigInvalid);
}

TEST(LoggingSettings, Apply_InitializesLogger) {
    auto& logger = Core::Logger::Instance();
    logger.Shutdown();

    LoggingSettings settings;
    settings.level = Core::LogLevel::Debug;
    settings.outputs = Core::LogOutput::None;

    ASSERT_TRUE(applyLoggingSettings(settings).isSuccess());
    EXPECT_TRUE(logger.IsLevelEnabled(Core::LogLevel::Debug));

    // A second setup without Shutdown() is refused
    EXPECT_RESULT_ERROR(applyLoggingSettings(settings), ErrorCode::ConfigInvalid);

    logger.Shutdown();
}

TEST(LoggingSettings, Apply_FileWithoutPath_Fails) {
    auto& logger = Core::Logger::Instance();
    logger.Shutdown();

    LoggingSettings settings;
    settings.outputs = Core::LogOutput::File;

    EXPECT_RESULT_ERROR(applyLoggingSettings(settings), ErrorCode::ConfigInvalid);
}
