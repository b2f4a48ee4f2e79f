/**
 * @file poly1305_engine.cpp
 * @brief Poly1305 Accumulator Engine Implementation
 *
 * RFC 8439 Section 2.5 polynomial evaluation modulo 2^130 - 5:
 * - Radix-2^26 limbs with 64-bit product accumulation
 * - Partial reduction after every block, full reduction at finish
 * - Branch-free final selection between h and h - p
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "polymac/internal/poly1305_impl.h"
#include "polymac/core/security.h"

/**
 * @brief Load 32-bit little-endian value
 */
static inline uint32_t load32_le(const uint8_t* p) {
    return ((uint32_t)p[0]) | ((uint32_t)p[1] << 8) |
           ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

/**
 * @brief Store 32-bit little-endian value
 */
static inline void store32_le(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)(v);
    p[1] = (uint8_t)(v >> 8);
    p[2] = (uint8_t)(v >> 16);
    p[3] = (uint8_t)(v >> 24);
}

extern "C" {

void polymac_poly1305_engine_init(polymac_poly1305_engine_t* st,
                                  const uint8_t key[POLYMAC_POLY1305_KEY_SIZE]) {
    uint32_t t0 = load32_le(&key[0]);
    uint32_t t1 = load32_le(&key[4]);
    uint32_t t2 = load32_le(&key[8]);
    uint32_t t3 = load32_le(&key[12]);

    // Clamp r while splitting into limbs:
    // top 4 bits of key[3,7,11,15] and low 2 bits of key[4,8,12] cleared
    st->r[0] = (t0) & POLY1305_LIMB_MASK;
    st->r[1] = ((t0 >> POLY1305_LIMB_BITS) | (t1 << 6)) & 0x3ffff03;
    st->r[2] = ((t1 >> 20) | (t2 << 12)) & 0x3ffc0ff;
    st->r[3] = ((t2 >> 14) | (t3 << 18)) & 0x3f03fff;
    st->r[4] = (t3 >> 8) & 0x00fffff;

    st->s5[0] = st->r[1] * 5;
    st->s5[1] = st->r[2] * 5;
    st->s5[2] = st->r[3] * 5;
    st->s5[3] = st->r[4] * 5;

    for (int i = 0; i < POLY1305_LIMB_COUNT; i++) {
        st->h[i] = 0;
    }

    st->pad[0] = load32_le(&key[16]);
    st->pad[1] = load32_le(&key[20]);
    st->pad[2] = load32_le(&key[24]);
    st->pad[3] = load32_le(&key[28]);
}

void polymac_poly1305_engine_blocks(polymac_poly1305_engine_t* st,
                                    const uint8_t* data, size_t len,
                                    int final_block) {
    const uint32_t hibit = final_block ? 0 : POLY1305_HIBIT;

    const uint32_t r0 = st->r[0];
    const uint32_t r1 = st->r[1];
    const uint32_t r2 = st->r[2];
    const uint32_t r3 = st->r[3];
    const uint32_t r4 = st->r[4];

    const uint32_t s1 = st->s5[0];
    const uint32_t s2 = st->s5[1];
    const uint32_t s3 = st->s5[2];
    const uint32_t s4 = st->s5[3];

    uint32_t h0 = st->h[0];
    uint32_t h1 = st->h[1];
    uint32_t h2 = st->h[2];
    uint32_t h3 = st->h[3];
    uint32_t h4 = st->h[4];

    while (len >= POLYMAC_POLY1305_BLOCK_SIZE) {
        uint32_t t0 = load32_le(&data[0]);
        uint32_t t1 = load32_le(&data[4]);
        uint32_t t2 = load32_le(&data[8]);
        uint32_t t3 = load32_le(&data[12]);

        // h += m
        h0 += (t0) & POLY1305_LIMB_MASK;
        h1 += ((t0 >> POLY1305_LIMB_BITS) | (t1 << 6)) & POLY1305_LIMB_MASK;
        h2 += ((t1 >> 20) | (t2 << 12)) & POLY1305_LIMB_MASK;
        h3 += ((t2 >> 14) | (t3 << 18)) & POLY1305_LIMB_MASK;
        h4 += (t3 >> 8) | hibit;

        // h *= r, terms above 2^130 folded back with the 5*r multipliers
        uint64_t d0 = (uint64_t)h0 * r0 + (uint64_t)h1 * s4 + (uint64_t)h2 * s3 +
                      (uint64_t)h3 * s2 + (uint64_t)h4 * s1;
        uint64_t d1 = (uint64_t)h0 * r1 + (uint64_t)h1 * r0 + (uint64_t)h2 * s4 +
                      (uint64_t)h3 * s3 + (uint64_t)h4 * s2;
        uint64_t d2 = (uint64_t)h0 * r2 + (uint64_t)h1 * r1 + (uint64_t)h2 * r0 +
                      (uint64_t)h3 * s4 + (uint64_t)h4 * s3;
        uint64_t d3 = (uint64_t)h0 * r3 + (uint64_t)h1 * r2 + (uint64_t)h2 * r1 +
                      (uint64_t)h3 * r0 + (uint64_t)h4 * s4;
        uint64_t d4 = (uint64_t)h0 * r4 + (uint64_t)h1 * r3 + (uint64_t)h2 * r2 +
                      (uint64_t)h3 * r1 + (uint64_t)h4 * r0;

        // (partial) h %= p
        uint64_t c;
        c = d0 >> POLY1305_LIMB_BITS; h0 = (uint32_t)d0 & POLY1305_LIMB_MASK;
        d1 += c; c = d1 >> POLY1305_LIMB_BITS; h1 = (uint32_t)d1 & POLY1305_LIMB_MASK;
        d2 += c; c = d2 >> POLY1305_LIMB_BITS; h2 = (uint32_t)d2 & POLY1305_LIMB_MASK;
        d3 += c; c = d3 >> POLY1305_LIMB_BITS; h3 = (uint32_t)d3 & POLY1305_LIMB_MASK;
        d4 += c; c = d4 >> POLY1305_LIMB_BITS; h4 = (uint32_t)d4 & POLY1305_LIMB_MASK;
        c = h0 + c * 5;        h0 = (uint32_t)c & POLY1305_LIMB_MASK;
        h1 += (uint32_t)(c >> POLY1305_LIMB_BITS);

        data += POLYMAC_POLY1305_BLOCK_SIZE;
        len -= POLYMAC_POLY1305_BLOCK_SIZE;
    }

    st->h[0] = h0;
    st->h[1] = h1;
    st->h[2] = h2;
    st->h[3] = h3;
    st->h[4] = h4;
}

void polymac_poly1305_engine_finish(const polymac_poly1305_engine_t* st,
                                    uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]) {
    uint32_t h0 = st->h[0];
    uint32_t h1 = st->h[1];
    uint32_t h2 = st->h[2];
    uint32_t h3 = st->h[3];
    uint32_t h4 = st->h[4];

    // Fully carry h
    uint32_t c;
    c = h1 >> POLY1305_LIMB_BITS; h1 &= POLY1305_LIMB_MASK; h2 += c;
    c = h2 >> POLY1305_LIMB_BITS; h2 &= POLY1305_LIMB_MASK; h3 += c;
    c = h3 >> POLY1305_LIMB_BITS; h3 &= POLY1305_LIMB_MASK; h4 += c;
    c = h4 >> POLY1305_LIMB_BITS; h4 &= POLY1305_LIMB_MASK; h0 += c * 5;
    c = h0 >> POLY1305_LIMB_BITS; h0 &= POLY1305_LIMB_MASK; h1 += c;

    // g = h + 5 - 2^130 = h - p
    uint32_t g0 = h0 + 5; c = g0 >> POLY1305_LIMB_BITS; g0 &= POLY1305_LIMB_MASK;
    uint32_t g1 = h1 + c; c = g1 >> POLY1305_LIMB_BITS; g1 &= POLY1305_LIMB_MASK;
    uint32_t g2 = h2 + c; c = g2 >> POLY1305_LIMB_BITS; g2 &= POLY1305_LIMB_MASK;
    uint32_t g3 = h3 + c; c = g3 >> POLY1305_LIMB_BITS; g3 &= POLY1305_LIMB_MASK;
    uint32_t g4 = h4 + c - (1U << POLY1305_LIMB_BITS);

    // h < p leaves g4 negative: select h. Otherwise select g.
    uint32_t borrow = g4 >> 31;
    h0 = polymac_ct_select_u32(borrow, g0, h0);
    h1 = polymac_ct_select_u32(borrow, g1, h1);
    h2 = polymac_ct_select_u32(borrow, g2, h2);
    h3 = polymac_ct_select_u32(borrow, g3, h3);
    h4 = polymac_ct_select_u32(borrow, g4, h4);

    // tag = (h + s) mod 2^128, limbs re-packed into 32-bit words with carry
    uint64_t f;
    f = (uint64_t)h0 + ((uint64_t)h1 << 26) + st->pad[0];
    store32_le(&tag[0], (uint32_t)f);
    f = (f >> 32) + ((uint64_t)h2 << 20) + st->pad[1];
    store32_le(&tag[4], (uint32_t)f);
    f = (f >> 32) + ((uint64_t)h3 << 14) + st->pad[2];
    store32_le(&tag[8], (uint32_t)f);
    f = (f >> 32) + ((uint64_t)h4 << 8) + st->pad[3];
    store32_le(&tag[12], (uint32_t)f);
}

}  // extern "C"
