/**
 * @file polymac.h
 * @brief polymac - Poly1305 One-Time Authenticator Library
 *
 * Unified header for the public API.
 *
 * Modules:
 * - Core: error codes, version information, security primitives
 * - Crypto: Poly1305 streaming MAC (C ABI + C++ class)
 * - Utils: hexadecimal encoding
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef POLYMAC_H
#define POLYMAC_H

#include "polymac/version.h"
#include "polymac/core/common.h"
#include "polymac/core/types.h"
#include "polymac/core/security.h"
#include "polymac/crypto/poly1305.h"
#include "polymac/utils/encoding.h"

// ============================================================================
// Quick Start Examples
// ============================================================================

/**
 * @example poly1305_example.cpp
 * @code
 * #include "polymac/polymac.h"
 *
 * // Key: 32 bytes, fresh for every message (e.g. from a ChaCha20 block)
 * polymac::ByteVec key = ...;
 *
 * polymac::Poly1305 mac(key);
 * mac.write(header.data(), header.size());
 * mac.write(body.data(), body.size());
 *
 * polymac::Poly1305Tag tag = mac.tag();
 * bool ok = mac.verify(received_tag);
 * @endcode
 */

#endif // POLYMAC_H
