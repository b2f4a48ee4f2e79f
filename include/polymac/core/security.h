/**
 * @file security.h
 * @brief Security primitives for polymac - Side-channel resistant operations
 *
 * This header provides security-critical functions including:
 * - Constant-time comparison to prevent timing attacks
 * - Constant-time selection
 * - Secure memory wiping
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef POLYMAC_CORE_SECURITY_H
#define POLYMAC_CORE_SECURITY_H

#include "polymac/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * Compares two memory regions in constant time to prevent timing attacks.
 * The execution time does not depend on the content of the memory regions.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 1 if equal, 0 if different (or if either pointer is NULL)
 */
POLYMAC_API int polymac_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Constant-time conditional select
 *
 * Returns a if condition is 0, b if condition is non-zero.
 *
 * @param condition Selection condition (0 selects a, non-zero selects b)
 * @param a Value returned if condition is 0
 * @param b Value returned if condition is non-zero
 * @return Selected value
 */
POLYMAC_API uint32_t polymac_ct_select_u32(uint32_t condition, uint32_t a, uint32_t b);

/**
 * @brief Secure memory zeroing
 *
 * Securely zeros memory, guaranteed not to be optimized away by compiler.
 *
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
POLYMAC_API void polymac_secure_zero(void* ptr, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace polymac {

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return polymac_secure_compare(a.data(), b.data(),
                                  a.size() * sizeof(typename Container::value_type)) == 1;
}

} // namespace polymac

#endif // __cplusplus

#endif // POLYMAC_CORE_SECURITY_H
