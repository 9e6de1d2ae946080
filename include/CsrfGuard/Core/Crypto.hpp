/**
 * @file Crypto.hpp
 * @brief Cryptographic primitives used by the token types
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * This module provides:
 * - Operating system random number generation
 * - Standard base64 encoding/decoding (OpenSSL)
 * - Constant-time comparison
 * - Secure memory zeroing
 */

#pragma once

#ifndef CSRFGUARD_CORE_CRYPTO_HPP
#define CSRFGUARD_CORE_CRYPTO_HPP

#include <CsrfGuard/Core/Types.hpp>
#include <CsrfGuard/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace CsrfGuard::Crypto {

// ============================================================================
// Secure Random Number Generator
// ============================================================================

/**
 * @brief Handle on the operating system random source
 *
 * Uses BCryptGenRandom on Windows and /dev/urandom elsewhere. Reads through
 * one handle are serialized, so a handle may be shared, but the token types
 * open a fresh handle for every value they generate.
 *
 * @throws std::runtime_error from the constructor if the random source
 *         cannot be opened
 */
class SecureRandom {
public:
    SecureRandom();
    ~SecureRandom();

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Buffer to fill
     * @param size Number of bytes to generate
     * @return Result indicating success or failure
     */
    Result<void> generate(Byte* buffer, size_t size);

    /**
     * @brief Fill a span with random bytes
     */
    Result<void> generate(MutableByteSpan buffer);

    /**
     * @brief Generate random byte buffer
     * @param size Number of bytes to generate
     * @return Random bytes or error
     */
    Result<ByteBuffer> generate(size_t size);

    /**
     * @brief Generate a uniformly distributed 32-bit value
     */
    Result<uint32_t> nextUint32();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Encode bytes as standard base64
 *
 * Alphabet A-Z a-z 0-9 + /, '=' padding, no line breaks.
 *
 * @param data Bytes to convert
 * @return Base64 string (empty for empty input)
 */
std::string toBase64(ByteSpan data);

/**
 * @brief Decode standard base64
 *
 * Accepts only padded input whose length is a multiple of four, with '='
 * allowed solely in the last two positions. No whitespace is skipped.
 *
 * @param base64 Base64 string
 * @return Decoded bytes or ErrorCode::InvalidBase64
 */
Result<ByteBuffer> fromBase64(std::string_view base64);

// ============================================================================
// Memory Utilities
// ============================================================================

/**
 * @brief Constant-time comparison of byte arrays
 *
 * Running time depends only on the lengths, never on where the buffers
 * differ. Buffers of different length compare unequal immediately.
 *
 * @return true if equal
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

/**
 * @brief Securely zero memory
 * @param data Memory to zero
 * @param size Size of memory
 */
void secureZero(void* data, size_t size) noexcept;

} // namespace CsrfGuard::Crypto

#endif // CSRFGUARD_CORE_CRYPTO_HPP
