/**
 * @file test_poly1305_engine.cpp
 * @brief Poly1305 accumulator engine unit tests
 *
 * Exercises the radix 2^26 engine directly:
 * - Key clamping and precomputed 5*r limbs
 * - High bit handling for full blocks vs padded final block
 * - Final reduction and repeatable finish
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <vector>
#include <string>

#include "polymac/internal/poly1305_impl.h"

/**
 * @brief Convert hex string to bytes
 */
static std::vector<uint8_t> hex_to_bytes(const std::string& hex) {
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < hex.length(); i += 2) {
        auto byte = static_cast<uint8_t>(
            std::stoi(hex.substr(i, 2), nullptr, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

/**
 * @brief Convert bytes to hex string
 */
static std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::string hex;
    char buf[3];
    for (size_t i = 0; i < len; ++i) {
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        hex += buf;
    }
    return hex;
}

class Poly1305EngineTest : public ::testing::Test {
protected:
    polymac_poly1305_engine_t st_;

    void init_with(const std::vector<uint8_t>& key) {
        ASSERT_EQ(key.size(), 32u);
        polymac_poly1305_engine_init(&st_, key.data());
    }

    std::string finish_hex() {
        uint8_t tag[16];
        polymac_poly1305_engine_finish(&st_, tag);
        return bytes_to_hex(tag, sizeof(tag));
    }
};

// ============================================================================
// Key Setup
// ============================================================================

TEST_F(Poly1305EngineTest, ClampAllOnesKey) {
    std::vector<uint8_t> key(32, 0xFF);
    init_with(key);

    EXPECT_EQ(st_.r[0], 0x3ffffffu);
    EXPECT_EQ(st_.r[1], 0x3ffff03u);
    EXPECT_EQ(st_.r[2], 0x3ffc0ffu);
    EXPECT_EQ(st_.r[3], 0x3f03fffu);
    EXPECT_EQ(st_.r[4], 0x00fffffu);

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(st_.s5[i], st_.r[i + 1] * 5) << "limb " << i;
        EXPECT_EQ(st_.pad[i], 0xffffffffu) << "pad word " << i;
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(st_.h[i], 0u) << "h limb " << i;
    }
}

TEST_F(Poly1305EngineTest, PadIsLittleEndianS) {
    auto key = hex_to_bytes(
        "00000000000000000000000000000000"
        "0102030405060708090a0b0c0d0e0f10");
    init_with(key);

    EXPECT_EQ(st_.pad[0], 0x04030201u);
    EXPECT_EQ(st_.pad[1], 0x08070605u);
    EXPECT_EQ(st_.pad[2], 0x0c0b0a09u);
    EXPECT_EQ(st_.pad[3], 0x100f0e0du);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(st_.r[i], 0u);
    }
}

/**
 * @brief Clamped bits of r never influence the result
 */
TEST_F(Poly1305EngineTest, ClampedBitsIgnored) {
    auto msg = hex_to_bytes("000102030405060708090a0b0c0d0e0f");

    auto raw = hex_to_bytes(
        "ffffffffffffffffffffffffffffffff"
        "00000000000000000000000000000000");
    auto clamped = hex_to_bytes(
        "ffffff0ffcffff0ffcffff0ffcffff0f"
        "00000000000000000000000000000000");

    init_with(raw);
    polymac_poly1305_engine_blocks(&st_, msg.data(), msg.size(), 0);
    std::string a = finish_hex();

    init_with(clamped);
    polymac_poly1305_engine_blocks(&st_, msg.data(), msg.size(), 0);
    std::string b = finish_hex();

    EXPECT_EQ(a, b);
}

// ============================================================================
// Block Processing
// ============================================================================

/**
 * @brief Full blocks carry 2^128, the padded final block does not
 *
 * r = 16, s = 0, block = 1:
 *   full:  16 * (2^128 + 1) = 2^132 + 16 = 20 + 16 (mod p) = 0x24
 *   final: 16 * 1 = 0x10
 */
TEST_F(Poly1305EngineTest, HighBitOnlyOnFullBlocks) {
    auto key = hex_to_bytes("10" + std::string(62, '0'));
    auto block = hex_to_bytes("01" + std::string(30, '0'));

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, block.data(), block.size(), 0);
    EXPECT_EQ(finish_hex(), "24" + std::string(30, '0'));

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, block.data(), block.size(), 1);
    EXPECT_EQ(finish_hex(), "10" + std::string(30, '0'));
}

/**
 * @brief r = 1: a full all-ones block yields 2^129 - 1, truncated to 2^128 - 1
 */
TEST_F(Poly1305EngineTest, IdentityMultiplier) {
    auto key = hex_to_bytes("01" + std::string(62, '0'));
    std::vector<uint8_t> block(16, 0xFF);

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, block.data(), block.size(), 0);
    EXPECT_EQ(finish_hex(), std::string(32, 'f'));
}

TEST_F(Poly1305EngineTest, MultiBlockCallMatchesSingleBlockCalls) {
    auto key = hex_to_bytes(
        "85d6be7857556d337f4452fe42d506a8"
        "0103808afb0db2fd4abff6af4149f51b");
    std::vector<uint8_t> data(16 * 9);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 37 + 11);
    }

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, data.data(), data.size(), 0);
    std::string bulk = finish_hex();

    init_with(key);
    for (size_t off = 0; off < data.size(); off += 16) {
        polymac_poly1305_engine_blocks(&st_, data.data() + off, 16, 0);
    }
    EXPECT_EQ(finish_hex(), bulk);
}

/**
 * @brief Partial trailing bytes in a blocks() call are ignored
 */
TEST_F(Poly1305EngineTest, TrailingBytesIgnored) {
    auto key = hex_to_bytes(
        "85d6be7857556d337f4452fe42d506a8"
        "0103808afb0db2fd4abff6af4149f51b");
    std::vector<uint8_t> data(16 + 7, 0x5A);

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, data.data(), 16, 0);
    std::string full = finish_hex();

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, data.data(), data.size(), 0);
    EXPECT_EQ(finish_hex(), full);
}

// ============================================================================
// Finalization
// ============================================================================

TEST_F(Poly1305EngineTest, FinishDoesNotModifyState) {
    auto key = hex_to_bytes(
        "746869732069732033322d6279746520"
        "6b657920666f7220506f6c7931333035");
    std::vector<uint8_t> zeros(32, 0);

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, zeros.data(), zeros.size(), 0);

    polymac_poly1305_engine_t before = st_;
    std::string first = finish_hex();
    std::string second = finish_hex();

    EXPECT_EQ(first, "49ec78090e481ec6c26b33b91ccc0307");
    EXPECT_EQ(first, second);
    EXPECT_EQ(0, memcmp(&before, &st_, sizeof(st_)));
}

/**
 * @brief RFC 8439 A.3 #5 through the raw engine: 2^130 - 2 reduces to 3
 */
TEST_F(Poly1305EngineTest, ReductionAtModulusBoundary) {
    auto key = hex_to_bytes("02" + std::string(62, '0'));
    std::vector<uint8_t> block(16, 0xFF);

    init_with(key);
    polymac_poly1305_engine_blocks(&st_, block.data(), block.size(), 0);
    EXPECT_EQ(finish_hex(), "03" + std::string(30, '0'));
}
