/**
 * @file SecretToken.cpp
 * @brief Server-side CSRF secret
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Token/SecretToken.hpp>
#include <CsrfGuard/Core/Crypto.hpp>
#include <CsrfGuard/Core/Logger.hpp>

#include "RandomWord.hpp"

#include <ostream>

namespace CsrfGuard::Token {

SecretToken SecretToken::generate() {
    return SecretToken(Internal::drawRandomWord("secret token"));
}

Result<SecretToken> SecretToken::fromBytes(ByteSpan bytes) {
    if (bytes.size() != SECRET_TOKEN_SIZE) {
        return ErrorCode::InvalidTokenLength;
    }

    return SecretToken(ByteOrder::fromLittleEndian<uint32_t>(bytes.first<SECRET_TOKEN_SIZE>()));
}

Result<SecretToken> SecretToken::fromBase64(std::string_view text) {
    auto decoded = Crypto::fromBase64(text);
    if (decoded.isFailure()) {
        CSRFGUARD_LOG_DEBUG("Rejected secret token text: invalid base64 input");
        return decoded.error();
    }

    ByteBuffer& bytes = decoded.value();
    auto token = fromBytes(bytes);
    Crypto::secureZero(bytes.data(), bytes.size());

    if (token.isFailure()) {
        CSRFGUARD_LOG_DEBUG_F("Rejected secret token text: decoded to %zu bytes, expected %zu",
                              bytes.size(), SECRET_TOKEN_SIZE);
    }

    return token;
}

std::string SecretToken::toBase64() const {
    auto bytes = toBytes();
    std::string text = Crypto::toBase64(bytes);
    Crypto::secureZero(bytes.data(), bytes.size());
    return text;
}

bool SecretToken::operator==(const SecretToken& other) const noexcept {
    const auto a = toBytes();
    const auto b = other.toBytes();
    return Crypto::constantTimeCompare(a, b);
}

std::ostream& operator<<(std::ostream& os, const SecretToken& token) {
    return os << token.toBase64();
}

} // namespace CsrfGuard::Token
