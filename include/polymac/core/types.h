/**
 * @file types.h
 * @brief Type definitions for polymac library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef POLYMAC_CORE_TYPES_H
#define POLYMAC_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

// C++ types
#ifdef __cplusplus

#include <vector>
#include <array>

namespace polymac {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Poly1305 authenticator
using Poly1305Tag = ByteArray<16>;

} // namespace polymac

#endif // __cplusplus

#endif // POLYMAC_CORE_TYPES_H
