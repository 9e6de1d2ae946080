/**
 * @file Base64.cpp
 * @brief Standard base64 encoding/decoding
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * OpenSSL's EVP block codec does the conversion. EVP_DecodeBlock treats
 * '=' as a zero digit and skips surrounding whitespace, so the structure of
 * the input is validated here first and the padding is trimmed afterwards.
 * Only the canonical encoding is accepted: unused bits in the final
 * quad must be zero.
 */

#include <CsrfGuard/Core/Crypto.hpp>
#include <openssl/evp.h>
#include <limits>

namespace CsrfGuard::Crypto {

namespace {

bool isBase64Digit(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

int digitValue(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    return c == '+' ? 62 : 63;
}

/**
 * The digit before the padding carries bits past the last encoded byte:
 * four with "==", two with "=". They must be zero, so every byte
 * sequence has exactly one accepted text.
 */
bool hasCanonicalTail(std::string_view base64, int padding) noexcept {
    if (padding == 0) {
        return true;
    }

    const int last = digitValue(base64[base64.size() - 1 - static_cast<size_t>(padding)]);
    const int unusedMask = padding == 2 ? 0x0F : 0x03;
    return (last & unusedMask) == 0;
}

/**
 * @return the number of '=' characters, or -1 if the text is not
 *         well-formed padded base64
 */
int countPadding(std::string_view base64) noexcept {
    if (base64.size() % 4 != 0) {
        return -1;
    }

    size_t padding = 0;
    while (padding < 2 && padding < base64.size() &&
           base64[base64.size() - 1 - padding] == '=') {
        ++padding;
    }

    const size_t digits = base64.size() - padding;
    for (size_t i = 0; i < digits; ++i) {
        if (!isBase64Digit(base64[i])) {
            return -1;
        }
    }

    return static_cast<int>(padding);
}

} // namespace

std::string toBase64(ByteSpan data) {
    if (data.empty()) {
        return "";
    }

    // 4 output characters per 3 input bytes plus the terminating NUL
    std::string result(4 * ((data.size() + 2) / 3) + 1, '\0');

    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(result.data()),
        data.data(),
        static_cast<int>(data.size())
    );

    result.resize(static_cast<size_t>(written));
    return result;
}

Result<ByteBuffer> fromBase64(std::string_view base64) {
    if (base64.empty()) {
        return ByteBuffer{};
    }

    if (base64.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return ErrorCode::InvalidBase64;
    }

    const int padding = countPadding(base64);
    if (padding < 0 || !hasCanonicalTail(base64, padding)) {
        return ErrorCode::InvalidBase64;
    }

    ByteBuffer buffer(base64.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(
        buffer.data(),
        reinterpret_cast<const unsigned char*>(base64.data()),
        static_cast<int>(base64.size())
    );

    if (decoded < 0 || static_cast<size_t>(decoded) != buffer.size()) {
        return ErrorCode::InvalidBase64;
    }

    buffer.resize(buffer.size() - static_cast<size_t>(padding));
    return buffer;
}

} // namespace CsrfGuard::Crypto
