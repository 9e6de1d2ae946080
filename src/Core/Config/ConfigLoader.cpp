/**
 * @file ConfigLoader.cpp
 * @brief Implementation of settings file loading
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Core/Config.hpp>

#ifdef _WIN32
#include <windows.h>
#include <shlwapi.h>
#pragma comment(lib, "shlwapi.lib")
#else
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <cerrno>
#endif

#include <sstream>

namespace CsrfGuard::Config {

namespace {

std::string trim(const std::string& s, const char* whitespace = " \t\r\n") {
    const size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

} // namespace

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
#ifdef _WIN32
        char fullPath[MAX_PATH];
        if (!PathCanonicalizeA(fullPath, path.c_str())) {
            return ErrorCode::InvalidPath;
        }
        return std::string(fullPath);
#else
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
#endif
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return ErrorCode::InvalidPath;
        }

        std::string allowed = allowedResult.value();
        if (allowed.empty() || (allowed.back() != '/' && allowed.back() != '\\')) {
#ifdef _WIN32
            allowed.push_back('\\');
#else
            allowed.push_back('/');
#endif
        }

        if (canonicalPath.length() < allowed.length()) {
            return false;
        }

#ifdef _WIN32
        return _strnicmp(canonicalPath.c_str(), allowed.c_str(), allowed.length()) == 0;
#else
        return canonicalPath.compare(0, allowed.length(), allowed) == 0;
#endif
    }

    Result<ByteBuffer> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

#ifdef _WIN32
        HANDLE hFile = CreateFileA(
            canonPath.c_str(),
            GENERIC_READ,
            FILE_SHARE_READ,
            nullptr,
            OPEN_EXISTING,
            FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN,
            nullptr
        );

        if (hFile == INVALID_HANDLE_VALUE) {
            return ErrorCode::FileNotFound;
        }

        LARGE_INTEGER fileSize;
        if (!GetFileSizeEx(hFile, &fileSize)) {
            CloseHandle(hFile);
            return ErrorCode::IOError;
        }

        if (static_cast<size_t>(fileSize.QuadPart) > options.max_file_size) {
            CloseHandle(hFile);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(fileSize.QuadPart));
        DWORD bytesRead = 0;
        const BOOL ok = data.empty() ||
            ReadFile(hFile, data.data(), static_cast<DWORD>(data.size()), &bytesRead, nullptr);
        CloseHandle(hFile);

        if (!ok || bytesRead != data.size()) {
            return ErrorCode::IOError;
        }

        return data;
#else
        // O_NOFOLLOW: the path was resolved above, refuse a symlink swapped in since
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::AccessDenied;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = read(fd, data.data() + total, data.size() - total);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                close(fd);
                return ErrorCode::IOError;
            }
            total += static_cast<size_t>(n);
        }
        close(fd);

        return data;
#endif
    }

    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;

        std::string content(reinterpret_cast<const char*>(data.data()), data.size());
        std::istringstream stream(content);
        std::string line;

        while (std::getline(stream, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            const size_t pos = line.find('=');
            if (pos == std::string::npos) {
                return ErrorCode::ConfigParseFailed;
            }

            std::string key = trim(line.substr(0, pos));
            if (key.empty()) {
                return ErrorCode::ConfigParseFailed;
            }

            config[key] = trim(line.substr(pos + 1));
        }

        return config;
    }
};

ConfigLoader::ConfigLoader()
    : ConfigLoader(Options{}) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(ByteSpan data) {
    if (data.size() > m_impl->options.max_file_size) {
        return ErrorCode::FileTooLarge;
    }

    return m_impl->parseConfig(data);
}

} // namespace CsrfGuard::Config
