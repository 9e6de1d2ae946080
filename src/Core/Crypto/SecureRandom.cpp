/**
 * @file SecureRandom.cpp
 * @brief Operating system random number generator
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * - Windows: BCryptGenRandom with BCRYPT_USE_SYSTEM_PREFERRED_RNG
 * - POSIX: /dev/urandom, retrying on EINTR
 */

#include <CsrfGuard/Core/Crypto.hpp>
#include <CsrfGuard/Core/ByteOrder.hpp>

#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#include <bcrypt.h>
#pragma comment(lib, "bcrypt.lib")
#else
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#endif

namespace CsrfGuard::Crypto {

// ============================================================================
// SecureRandom::Impl - Platform-specific implementation
// ============================================================================

class SecureRandom::Impl {
public:
    Impl() {
#ifndef _WIN32
        do {
            m_fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
        } while (m_fd < 0 && errno == EINTR);

        if (m_fd < 0) {
            throw std::runtime_error(std::string("Failed to open /dev/urandom: ") +
                                     std::strerror(errno));
        }
#endif
    }

    ~Impl() {
#ifndef _WIN32
        if (m_fd >= 0) {
            close(m_fd);
        }
#endif
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    Result<void> generate(Byte* buffer, size_t size) {
        if (buffer == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }

        if (size == 0) {
            return Result<void>::Success();
        }

#ifdef _WIN32
        NTSTATUS status = BCryptGenRandom(
            nullptr,
            buffer,
            static_cast<ULONG>(size),
            BCRYPT_USE_SYSTEM_PREFERRED_RNG
        );

        if (!BCRYPT_SUCCESS(status)) {
            return ErrorCode::RandomGenerationFailed;
        }

        return Result<void>::Success();
#else
        std::lock_guard<std::mutex> lock(m_mutex);

        size_t total = 0;
        while (total < size) {
            ssize_t n = read(m_fd, buffer + total, size - total);

            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ErrorCode::RandomGenerationFailed;
            }

            if (n == 0) {
                // unexpected EOF
                return ErrorCode::RandomGenerationFailed;
            }

            total += static_cast<size_t>(n);
        }

        return Result<void>::Success();
#endif
    }

private:
#ifndef _WIN32
    int m_fd = -1;
    std::mutex m_mutex;
#endif
};

// ============================================================================
// SecureRandom - Public API
// ============================================================================

SecureRandom::SecureRandom()
    : m_impl(std::make_unique<Impl>()) {
}

SecureRandom::~SecureRandom() = default;

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    return m_impl->generate(buffer, size);
}

Result<void> SecureRandom::generate(MutableByteSpan buffer) {
    return m_impl->generate(buffer.data(), buffer.size());
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer buffer(size);
    auto result = m_impl->generate(buffer.data(), size);

    if (result.isFailure()) {
        return result.error();
    }

    return buffer;
}

Result<uint32_t> SecureRandom::nextUint32() {
    std::array<Byte, sizeof(uint32_t)> bytes{};
    auto result = m_impl->generate(bytes.data(), bytes.size());

    if (result.isFailure()) {
        return result.error();
    }

    const uint32_t value = ByteOrder::fromLittleEndian<uint32_t>(bytes);
    secureZero(bytes.data(), bytes.size());
    return value;
}

} // namespace CsrfGuard::Crypto
