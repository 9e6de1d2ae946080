/**
 * @file test_byte_order.cpp
 * @brief Unit tests for little-endian conversion helpers
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Core/ByteOrder.hpp>
#include <gtest/gtest.h>
#include <array>

using namespace CsrfGuard;
using namespace CsrfGuard::ByteOrder;

TEST(ByteOrder, ToLittleEndian_Uint32) {
    auto bytes = toLittleEndian<uint32_t>(0x04030201u);

    EXPECT_EQ(bytes, (std::array<Byte, 4>{0x01, 0x02, 0x03, 0x04}));
}

TEST(ByteOrder, ToLittleEndian_Uint64) {
    auto bytes = toLittleEndian<uint64_t>(0x0807060504030201ull);

    EXPECT_EQ(bytes, (std::array<Byte, 8>{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}));
}

TEST(ByteOrder, FromLittleEndian_Uint32) {
    const std::array<Byte, 4> bytes{0xEF, 0xBE, 0xAD, 0xDE};

    EXPECT_EQ(fromLittleEndian<uint32_t>(bytes), 0xDEADBEEFu);
}

TEST(ByteOrder, FromLittleEndian_HighBitsSurvive) {
    const std::array<Byte, 8> bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xFF};

    EXPECT_EQ(fromLittleEndian<uint64_t>(bytes), 0xFF00000000000000ull);
}

TEST(ByteOrder, ConversionsAreConstexpr) {
    static constexpr auto bytes = toLittleEndian<uint32_t>(0xCAFEBABEu);
    static_assert(bytes[0] == 0xBE && bytes[3] == 0xCA);
    static_assert(fromLittleEndian<uint32_t>(bytes) == 0xCAFEBABEu);
}

TEST(ByteOrder, IndependentOfHostOrder) {
    for (uint32_t value : {0u, 1u, 0x80000000u, 0x12345678u, 0xFFFFFFFFu}) {
        auto bytes = toLittleEndian(value);
        EXPECT_EQ(bytes[0], static_cast<Byte>(value & 0xFF));
        EXPECT_EQ(bytes[3], static_cast<Byte>(value >> 24));
        EXPECT_EQ(fromLittleEndian<uint32_t>(bytes), value);
    }
}
