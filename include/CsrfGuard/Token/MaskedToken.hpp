/**
 * @file MaskedToken.hpp
 * @brief Per-form CSRF token derived from a SecretToken
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#pragma once

#ifndef CSRFGUARD_TOKEN_MASKED_TOKEN_HPP
#define CSRFGUARD_TOKEN_MASKED_TOKEN_HPP

#include <CsrfGuard/Token/SecretToken.hpp>
#include <iosfwd>
#include <string>
#include <string_view>

namespace CsrfGuard::Token {

/**
 * @brief A token that can be embedded in HTML forms
 *
 * A fresh 32-bit one-time pad concatenated with the secret XORed against
 * that pad. Every rendered form gets a different value, yet everything
 * needed to recover the secret travels with it.
 *
 * Layout of the 64-bit value:
 * - bits 32-63: one-time pad
 * - bits  0-31: pad ^ secret
 *
 * Serialized little-endian as a whole, bytes 0-3 hold the masked word and
 * bytes 4-7 the pad. Text format: standard base64 with padding (always 12
 * characters).
 *
 * @note Masking hides the secret from casual comparison of rendered pages.
 *       It does not authenticate the token: anyone who knows the secret can
 *       produce valid masked tokens.
 */
class MaskedToken {
public:
    /**
     * @brief Mask a secret with a fresh pad from the operating system
     *        random source
     *
     * @throws std::runtime_error if the random source cannot be opened or
     *         read
     */
    [[nodiscard]] static MaskedToken generate(const SecretToken& secret);

    /**
     * @brief Mask a secret with the given pad
     */
    [[nodiscard]] static constexpr MaskedToken withPad(const SecretToken& secret,
                                                       uint32_t oneTimePad) noexcept {
        const uint32_t masked = oneTimePad ^ secret.bits();
        return MaskedToken((static_cast<uint64_t>(oneTimePad) << 32) | masked);
    }

    /**
     * @brief Construct over a raw packed value
     */
    [[nodiscard]] static constexpr MaskedToken fromValue(uint64_t value) noexcept {
        return MaskedToken(value);
    }

    /**
     * @brief Read the 8-byte little-endian wire format
     * @return the token, or ErrorCode::InvalidTokenLength unless exactly
     *         8 bytes are given
     */
    [[nodiscard]] static Result<MaskedToken> fromBytes(ByteSpan bytes);

    /**
     * @brief Parse the base64 text format
     * @return the token, ErrorCode::InvalidBase64 or
     *         ErrorCode::InvalidTokenLength
     */
    [[nodiscard]] static Result<MaskedToken> fromBase64(std::string_view text);

    /**
     * @brief Recover the secret this token was masked from
     *
     * Total: any packed value unmasks to some secret. Whether it is the
     * session's secret is for the caller to check.
     */
    [[nodiscard]] constexpr SecretToken unmask() const noexcept {
        return SecretToken::fromBits(oneTimePad() ^ maskedBits());
    }

    [[nodiscard]] constexpr uint32_t oneTimePad() const noexcept {
        return static_cast<uint32_t>(m_value >> 32);
    }

    [[nodiscard]] constexpr uint32_t maskedBits() const noexcept {
        return static_cast<uint32_t>(m_value & 0xFFFFFFFFu);
    }

    [[nodiscard]] constexpr uint64_t value() const noexcept {
        return m_value;
    }

    [[nodiscard]] constexpr MaskedTokenBytes toBytes() const noexcept {
        return ByteOrder::toLittleEndian(m_value);
    }

    [[nodiscard]] std::string toBase64() const;

    [[nodiscard]] constexpr bool operator==(const MaskedToken& other) const noexcept {
        return m_value == other.m_value;
    }

    [[nodiscard]] constexpr bool operator!=(const MaskedToken& other) const noexcept {
        return m_value != other.m_value;
    }

private:
    explicit constexpr MaskedToken(uint64_t value) noexcept
        : m_value(value) {}

    uint64_t m_value;
};

/**
 * @brief Write the base64 text format
 */
std::ostream& operator<<(std::ostream& os, const MaskedToken& token);

} // namespace CsrfGuard::Token

#endif // CSRFGUARD_TOKEN_MASKED_TOKEN_HPP
