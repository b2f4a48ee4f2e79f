/**
 * @file poly1305_impl.h
 * @brief Poly1305 Accumulator Engine - RFC 8439 Section 2.5
 *
 * Internal header for the Poly1305 arithmetic core.
 * This file contains implementation details not intended for public API.
 *
 * The accumulator h and the clamped multiplier r are held in radix 2^26
 * (five 26-bit limbs, 130 bits). Products of two limbs fit in 52 bits and a
 * row of five products fits comfortably in 64 bits, so the multiply-reduce
 * step needs no 128-bit integer type. Reduction modulo p = 2^130 - 5 uses
 * 2^130 == 5 (mod p): the carry out of the top limb is folded back into the
 * bottom limb multiplied by 5.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef POLYMAC_INTERNAL_POLY1305_IMPL_H
#define POLYMAC_INTERNAL_POLY1305_IMPL_H

#include "polymac/core/common.h"
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Limb layout */
#define POLY1305_LIMB_BITS   26
#define POLY1305_LIMB_MASK   0x3ffffffU
#define POLY1305_LIMB_COUNT  5

/* Bit 128 expressed in the top limb (128 - 4*26 = 24) */
#define POLY1305_HIBIT       (1U << 24)

/**
 * @brief Accumulator engine state
 *
 * Plain value type: copying it snapshots the whole computation.
 */
typedef struct {
    uint32_t r[POLY1305_LIMB_COUNT];  // Clamped key r (radix-2^26)
    uint32_t s5[4];                   // 5 * r[1..4] for modular reduction
    uint32_t h[POLY1305_LIMB_COUNT];  // Accumulator (radix-2^26)
    uint32_t pad[4];                  // Key s, four little-endian words
} polymac_poly1305_engine_t;

/**
 * @brief Initialize engine from a 32-byte key
 *
 * Clamps r = key[0..15] with 0x0ffffffc0ffffffc0ffffffc0fffffff, stores
 * s = key[16..31] and sets h = 0.
 */
void polymac_poly1305_engine_init(polymac_poly1305_engine_t* st,
                                  const uint8_t key[POLYMAC_POLY1305_KEY_SIZE]);

/**
 * @brief Fold whole 16-byte blocks into the accumulator
 *
 * For every block m: h = (h + m + 2^128) * r mod p, or without the 2^128
 * term when final_block is non-zero (the caller has already appended the
 * 0x01 padding byte to a short final block).
 *
 * @param len Byte count; bytes past the last whole block are ignored
 */
void polymac_poly1305_engine_blocks(polymac_poly1305_engine_t* st,
                                    const uint8_t* data, size_t len,
                                    int final_block);

/**
 * @brief Produce the tag for the absorbed blocks
 *
 * tag = ((h mod p) + s) mod 2^128, little-endian. Works on a local copy of
 * h; the engine state is left unchanged so this may be called repeatedly.
 */
void polymac_poly1305_engine_finish(const polymac_poly1305_engine_t* st,
                                    uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]);

#ifdef __cplusplus
}
#endif

#endif // POLYMAC_INTERNAL_POLY1305_IMPL_H
