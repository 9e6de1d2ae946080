/**
 * @file SecretToken.hpp
 * @brief Server-side CSRF secret
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#pragma once

#ifndef CSRFGUARD_TOKEN_SECRET_TOKEN_HPP
#define CSRFGUARD_TOKEN_SECRET_TOKEN_HPP

#include <CsrfGuard/Core/Types.hpp>
#include <CsrfGuard/Core/ErrorCodes.hpp>
#include <CsrfGuard/Core/ByteOrder.hpp>
#include <iosfwd>
#include <string>
#include <string_view>

namespace CsrfGuard::Token {

/**
 * @brief The token that submitted form tokens are compared against
 *
 * An opaque 32-bit pattern, generated once per session and kept in the
 * server-side session state. It is never sent to the client as is; forms
 * carry a MaskedToken derived from it.
 *
 * Wire format: 4 bytes, little-endian. Text format: standard base64 of the
 * wire format with padding (always 8 characters).
 *
 * @example
 * ```cpp
 * // session start
 * auto secret = SecretToken::generate();
 * session.set("csrf", secret.toBase64());
 *
 * // later requests
 * auto stored = SecretToken::fromBase64(session.get("csrf"));
 * ```
 */
class SecretToken {
public:
    /// All-zero placeholder, e.g. for a session that has no secret yet
    constexpr SecretToken() noexcept = default;

    /**
     * @brief Create a new secret from the operating system random source
     *
     * Opens its own random source handle for every call.
     *
     * @throws std::runtime_error if the random source cannot be opened or
     *         read. There is no fallback to a weaker generator.
     */
    [[nodiscard]] static SecretToken generate();

    /**
     * @brief Construct over a fixed bit pattern
     */
    [[nodiscard]] static constexpr SecretToken fromBits(uint32_t bits) noexcept {
        return SecretToken(bits);
    }

    /**
     * @brief Read the 4-byte little-endian wire format
     * @return the token, or ErrorCode::InvalidTokenLength unless exactly
     *         4 bytes are given
     */
    [[nodiscard]] static Result<SecretToken> fromBytes(ByteSpan bytes);

    /**
     * @brief Parse the base64 text format
     * @return the token, ErrorCode::InvalidBase64 if the text is not
     *         standard base64, or ErrorCode::InvalidTokenLength if it does
     *         not decode to exactly 4 bytes
     */
    [[nodiscard]] static Result<SecretToken> fromBase64(std::string_view text);

    [[nodiscard]] constexpr uint32_t bits() const noexcept {
        return m_bits;
    }

    [[nodiscard]] constexpr bool isZero() const noexcept {
        return m_bits == 0;
    }

    [[nodiscard]] constexpr SecretTokenBytes toBytes() const noexcept {
        return ByteOrder::toLittleEndian(m_bits);
    }

    [[nodiscard]] std::string toBase64() const;

    /**
     * @brief Exact bitwise equality, evaluated in constant time
     */
    [[nodiscard]] bool operator==(const SecretToken& other) const noexcept;

    [[nodiscard]] bool operator!=(const SecretToken& other) const noexcept {
        return !(*this == other);
    }

private:
    explicit constexpr SecretToken(uint32_t bits) noexcept
        : m_bits(bits) {}

    uint32_t m_bits = 0;
};

/**
 * @brief Write the base64 text format
 */
std::ostream& operator<<(std::ostream& os, const SecretToken& token);

} // namespace CsrfGuard::Token

#endif // CSRFGUARD_TOKEN_SECRET_TOKEN_HPP
