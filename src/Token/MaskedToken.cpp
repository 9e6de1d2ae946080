/**
 * @file MaskedToken.cpp
 * @brief Per-form CSRF token derived from a SecretToken
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Token/MaskedToken.hpp>
#include <CsrfGuard/Core/Crypto.hpp>
#include <CsrfGuard/Core/Logger.hpp>

#include "RandomWord.hpp"

#include <ostream>

namespace CsrfGuard::Token {

MaskedToken MaskedToken::generate(const SecretToken& secret) {
    return withPad(secret, Internal::drawRandomWord("one-time pad"));
}

Result<MaskedToken> MaskedToken::fromBytes(ByteSpan bytes) {
    if (bytes.size() != MASKED_TOKEN_SIZE) {
        return ErrorCode::InvalidTokenLength;
    }

    return MaskedToken(ByteOrder::fromLittleEndian<uint64_t>(bytes.first<MASKED_TOKEN_SIZE>()));
}

Result<MaskedToken> MaskedToken::fromBase64(std::string_view text) {
    auto decoded = Crypto::fromBase64(text);
    if (decoded.isFailure()) {
        CSRFGUARD_LOG_DEBUG("Rejected masked token text: invalid base64 input");
        return decoded.error();
    }

    const ByteBuffer& bytes = decoded.value();
    auto token = fromBytes(bytes);
    if (token.isFailure()) {
        CSRFGUARD_LOG_DEBUG_F("Rejected masked token text: decoded to %zu bytes, expected %zu",
                              bytes.size(), MASKED_TOKEN_SIZE);
    }

    return token;
}

std::string MaskedToken::toBase64() const {
    return Crypto::toBase64(toBytes());
}

std::ostream& operator<<(std::ostream& os, const MaskedToken& token) {
    return os << token.toBase64();
}

} // namespace CsrfGuard::Token
