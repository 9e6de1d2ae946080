/**
 * @file Types.hpp
 * @brief Core type definitions for the CsrfGuard token library
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the CsrfGuard codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef CSRFGUARD_CORE_TYPES_HPP
#define CSRFGUARD_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>

namespace CsrfGuard {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw memory operations
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Token Types
// ============================================================================

/// Wire size of a secret token (little-endian u32)
constexpr size_t SECRET_TOKEN_SIZE = 4;

/// Wire size of a masked token (little-endian u64)
constexpr size_t MASKED_TOKEN_SIZE = 8;

/// Serialized secret token
using SecretTokenBytes = std::array<Byte, SECRET_TOKEN_SIZE>;

/// Serialized masked token
using MaskedTokenBytes = std::array<Byte, MASKED_TOKEN_SIZE>;

} // namespace CsrfGuard

#endif // CSRFGUARD_CORE_TYPES_HPP
