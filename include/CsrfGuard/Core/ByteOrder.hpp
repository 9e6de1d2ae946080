/**
 * @file ByteOrder.hpp
 * @brief Little-endian conversion between fixed-width integers and bytes
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * Little-endian is the canonical wire format of every token. The helpers
 * shift bytes explicitly, so the result does not depend on host byte order
 * and no object is ever viewed through a pointer of another type.
 */

#pragma once

#ifndef CSRFGUARD_CORE_BYTE_ORDER_HPP
#define CSRFGUARD_CORE_BYTE_ORDER_HPP

#include <CsrfGuard/Core/Types.hpp>
#include <array>
#include <type_traits>

namespace CsrfGuard::ByteOrder {

/**
 * @brief Encode an unsigned integer as little-endian bytes
 * @tparam T Unsigned integer type
 * @param value Value to encode
 * @return sizeof(T) bytes, least significant first
 */
template<typename T>
[[nodiscard]] constexpr std::array<Byte, sizeof(T)> toLittleEndian(T value) noexcept {
    static_assert(std::is_unsigned_v<T>, "toLittleEndian requires an unsigned type");

    std::array<Byte, sizeof(T)> bytes{};
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<Byte>(value >> (8 * i));
    }
    return bytes;
}

/**
 * @brief Decode little-endian bytes into an unsigned integer
 * @tparam T Unsigned integer type
 * @param bytes Exactly sizeof(T) bytes, least significant first
 */
template<typename T>
[[nodiscard]] constexpr T fromLittleEndian(std::span<const Byte, sizeof(T)> bytes) noexcept {
    static_assert(std::is_unsigned_v<T>, "fromLittleEndian requires an unsigned type");

    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(bytes[i]) << (8 * i);
    }
    return value;
}

} // namespace CsrfGuard::ByteOrder

#endif // CSRFGUARD_CORE_BYTE_ORDER_HPP
