/**
 * @file RandomWord.cpp
 * @brief Fail-fast random draw shared by the token types
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * A host without a working entropy source cannot issue tokens at all.
 * Rather than hand out a predictable value, the failure is logged as
 * CRITICAL and raised as an exception that token generation does not catch.
 */

#include "RandomWord.hpp"

#include <CsrfGuard/Core/Crypto.hpp>
#include <CsrfGuard/Core/Logger.hpp>

#include <stdexcept>
#include <string>

namespace CsrfGuard::Token::Internal {

uint32_t drawRandomWord(const char* purpose) {
    std::string reason;

    try {
        Crypto::SecureRandom rng;
        auto word = rng.nextUint32();
        if (word.isSuccess()) {
            return word.value();
        }
        reason = std::string(getErrorMessage(word.error()));
    } catch (const std::runtime_error& e) {
        reason = e.what();
    }

    CSRFGUARD_LOG_CRITICAL_F("Cannot generate %s: %s", purpose, reason.c_str());
    throw std::runtime_error(std::string("Cannot generate ") + purpose +
                             ": operating system random source unavailable (" +
                             reason + ")");
}

} // namespace CsrfGuard::Token::Internal
