/**
 * @file test_security.cpp
 * @brief Secure memory and constant-time primitive tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <array>
#include <vector>
#include "polymac/core/security.h"
#include "polymac/polymac.h"

class SecurityTest : public ::testing::Test {};

// ============================================================================
// Secure Memory Operations Tests
// ============================================================================

TEST_F(SecurityTest, SecureZero_NullPointer) {
    polymac_secure_zero(nullptr, 100);
    SUCCEED();
}

TEST_F(SecurityTest, SecureZero_ZeroLength) {
    uint8_t buffer[16] = {0xFF, 0xFF, 0xFF, 0xFF};
    polymac_secure_zero(buffer, 0);
    EXPECT_EQ(buffer[0], 0xFF);
}

TEST_F(SecurityTest, SecureZero_ValidBuffer) {
    uint8_t buffer[32];
    memset(buffer, 0xAA, sizeof(buffer));

    polymac_secure_zero(buffer, sizeof(buffer));

    for (size_t i = 0; i < sizeof(buffer); i++) {
        EXPECT_EQ(buffer[i], 0) << "Byte " << i << " not zeroed";
    }
}

TEST_F(SecurityTest, ClearWipesContext) {
    polymac_poly1305_ctx_t ctx;
    uint8_t key[32];
    memset(key, 0x5C, sizeof(key));

    ASSERT_EQ(polymac_poly1305_init(&ctx, key, sizeof(key)), POLYMAC_SUCCESS);
    ASSERT_EQ(polymac_poly1305_update(&ctx, key, 7), POLYMAC_SUCCESS);
    polymac_poly1305_clear(&ctx);

    const uint8_t* raw = reinterpret_cast<const uint8_t*>(&ctx);
    for (size_t i = 0; i < sizeof(ctx); i++) {
        EXPECT_EQ(raw[i], 0) << "Byte " << i << " not wiped";
    }
}

// ============================================================================
// Constant-Time Comparison Tests
// ============================================================================

TEST_F(SecurityTest, SecureCompare_NullPointers) {
    uint8_t buffer[16] = {0};

    // Null pointers compare as not equal
    EXPECT_EQ(polymac_secure_compare(nullptr, buffer, 16), 0);
    EXPECT_EQ(polymac_secure_compare(buffer, nullptr, 16), 0);
    EXPECT_EQ(polymac_secure_compare(nullptr, nullptr, 16), 0);
}

TEST_F(SecurityTest, SecureCompare_ZeroLength) {
    uint8_t a[16] = {0xAA};
    uint8_t b[16] = {0xBB};
    EXPECT_EQ(polymac_secure_compare(a, b, 0), 1);
}

TEST_F(SecurityTest, SecureCompare_EveryPosition) {
    uint8_t base[16];
    uint8_t test[16];
    memset(base, 0xAA, sizeof(base));
    memcpy(test, base, sizeof(test));

    EXPECT_EQ(polymac_secure_compare(base, test, sizeof(base)), 1);

    for (size_t i = 0; i < sizeof(test); i++) {
        test[i] ^= 0x01;
        EXPECT_EQ(polymac_secure_compare(base, test, sizeof(base)), 0) << "position " << i;
        test[i] ^= 0x01;
    }
}

TEST_F(SecurityTest, SecureCompare_Containers) {
    std::array<uint8_t, 16> a{};
    std::array<uint8_t, 16> b{};
    EXPECT_TRUE(polymac::secure_compare(a, b));

    b[15] = 1;
    EXPECT_FALSE(polymac::secure_compare(a, b));

    std::vector<uint8_t> shorter(8, 0);
    std::vector<uint8_t> longer(9, 0);
    EXPECT_FALSE(polymac::secure_compare(shorter, longer));
}

// ============================================================================
// Constant-Time Selection Tests
// ============================================================================

TEST_F(SecurityTest, ConstantTimeSelect) {
    uint32_t a = 0x11111111u;
    uint32_t b = 0x22222222u;

    // condition != 0 selects b
    EXPECT_EQ(polymac_ct_select_u32(1, a, b), b);
    EXPECT_EQ(polymac_ct_select_u32(0xFFFFFFFFu, a, b), b);

    // condition == 0 selects a
    EXPECT_EQ(polymac_ct_select_u32(0, a, b), a);
}

// ============================================================================
// Version Information
// ============================================================================

TEST_F(SecurityTest, VersionStrings) {
    EXPECT_STREQ(polymac_version(), POLYMAC_VERSION_STRING);
    EXPECT_NE(std::strlen(polymac_platform()), 0u);
    EXPECT_TRUE(POLYMAC_VERSION_AT_LEAST(1, 0, 0));
}
