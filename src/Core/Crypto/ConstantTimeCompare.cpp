/**
 * @file ConstantTimeCompare.cpp
 * @brief Constant-time comparison to prevent timing side-channel attacks
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * Secret token equality goes through here so that comparing a submitted
 * token against the session token takes the same time wherever the two
 * differ.
 */

#include <CsrfGuard/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace CsrfGuard::Crypto {

/**
 * Token sizes are public, so the length check may return early. The byte
 * comparison is OpenSSL's CRYPTO_memcmp, which always inspects every byte.
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace CsrfGuard::Crypto
