/**
 * @file test_encoding.cpp
 * @brief Hex encoding unit tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include "polymac/utils/encoding.h"

using polymac::ByteVec;
namespace enc = polymac::encoding;

// ============================================================================
// C API
// ============================================================================

TEST(EncodingTest, HexEncode_BoundaryConditions) {
    uint8_t data[] = {0xDE, 0xAD, 0xBE, 0xEF};
    char hex[32] = {0};

    size_t result = polymac_hex_encode(data, sizeof(data), hex, sizeof(hex));
    EXPECT_EQ(result, 8u);
    EXPECT_STREQ(hex, "deadbeef");

    // Needs 9 bytes (8 + null)
    char small_hex[8] = {0};
    result = polymac_hex_encode(data, sizeof(data), small_hex, sizeof(small_hex));
    EXPECT_EQ(result, 0u);

    EXPECT_EQ(polymac_hex_encode(nullptr, 4, hex, sizeof(hex)), 0u);
    EXPECT_EQ(polymac_hex_encode(data, 4, nullptr, sizeof(hex)), 0u);
    EXPECT_EQ(polymac_hex_encode(data, 0, hex, sizeof(hex)), 0u);
}

TEST(EncodingTest, HexDecode_InvalidInput) {
    uint8_t output[16] = {0};

    EXPECT_EQ(polymac_hex_decode("ghij", 4, output, sizeof(output)), 0u);
    EXPECT_EQ(polymac_hex_decode("abc", 3, output, sizeof(output)), 0u);
    EXPECT_EQ(polymac_hex_decode("deadbeef", 8, output, 2), 0u);

    size_t result = polymac_hex_decode("DEadBEef", 0, output, sizeof(output));
    EXPECT_EQ(result, 4u);
    EXPECT_EQ(output[0], 0xDE);
    EXPECT_EQ(output[1], 0xAD);
    EXPECT_EQ(output[2], 0xBE);
    EXPECT_EQ(output[3], 0xEF);
}

TEST(EncodingTest, HexDecode_Prefix) {
    uint8_t output[4] = {0};
    EXPECT_EQ(polymac_hex_decode("0x1305", 6, output, sizeof(output)), 2u);
    EXPECT_EQ(output[0], 0x13);
    EXPECT_EQ(output[1], 0x05);
}

TEST(EncodingTest, HexCharValue) {
    EXPECT_EQ(polymac_hex_char_value('0'), 0);
    EXPECT_EQ(polymac_hex_char_value('9'), 9);
    EXPECT_EQ(polymac_hex_char_value('a'), 10);
    EXPECT_EQ(polymac_hex_char_value('F'), 15);
    EXPECT_EQ(polymac_hex_char_value('g'), -1);
    EXPECT_EQ(polymac_hex_char_value(' '), -1);
}

// ============================================================================
// C++ API
// ============================================================================

TEST(EncodingTest, HexEncode_Cpp) {
    EXPECT_EQ(enc::hexEncode(ByteVec{0x00, 0x0f, 0xf0, 0xff}), "000ff0ff");
    EXPECT_EQ(enc::hexEncode(ByteVec()), "");
}

TEST(EncodingTest, HexDecode_Cpp) {
    EXPECT_EQ(enc::hexDecode("000ff0ff"), (ByteVec{0x00, 0x0f, 0xf0, 0xff}));
    EXPECT_EQ(enc::hexDecode("0XABCD"), (ByteVec{0xab, 0xcd}));
    EXPECT_TRUE(enc::hexDecode("").empty());
    EXPECT_TRUE(enc::hexDecode("0x").empty());
}

TEST(EncodingTest, HexDecode_CppRejectsMalformed) {
    EXPECT_THROW(enc::hexDecode("abc"), enc::EncodingError);
    EXPECT_THROW(enc::hexDecode("zz"), enc::EncodingError);
    EXPECT_THROW(enc::hexDecode("12 34"), enc::EncodingError);
}

TEST(EncodingTest, IsValidHex) {
    EXPECT_TRUE(enc::isValidHex("deadBEEF"));
    EXPECT_TRUE(enc::isValidHex("0x00"));
    EXPECT_FALSE(enc::isValidHex("0x0"));
    EXPECT_FALSE(enc::isValidHex("xyz1"));
}
