/**
 * @file SecureZero.cpp
 * @brief Secure memory zeroing with compiler barrier protection
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * Scratch buffers that held secret token bytes (decoded base64, raw random
 * output) are wiped with this before they are released.
 */

#include <CsrfGuard/Core/Crypto.hpp>
#include <atomic>

#ifdef _WIN32
#include <windows.h>
#endif

namespace CsrfGuard::Crypto {

void secureZero(void* data, size_t size) noexcept {
    if (size == 0) {
        return;
    }

#ifdef _WIN32
    SecureZeroMemory(data, size);
#else
    volatile unsigned char* ptr = static_cast<volatile unsigned char*>(data);
    while (size--) {
        *ptr++ = 0;
    }

    #if defined(__GNUC__) || defined(__clang__)
        __asm__ __volatile__("" ::: "memory");
    #else
        std::atomic_thread_fence(std::memory_order_seq_cst);
    #endif
#endif
}

} // namespace CsrfGuard::Crypto
