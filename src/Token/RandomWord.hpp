/**
 * @file RandomWord.hpp
 * @brief Fail-fast random draw shared by the token types
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#pragma once

#ifndef CSRFGUARD_TOKEN_RANDOM_WORD_HPP
#define CSRFGUARD_TOKEN_RANDOM_WORD_HPP

#include <cstdint>

namespace CsrfGuard::Token::Internal {

/**
 * @brief Draw 32 bits from a freshly opened random source handle
 * @param purpose What the bits are for, used in the diagnostic
 * @throws std::runtime_error if the random source is unusable
 */
uint32_t drawRandomWord(const char* purpose);

} // namespace CsrfGuard::Token::Internal

#endif // CSRFGUARD_TOKEN_RANDOM_WORD_HPP
