/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * Constant-time comparison and selection, non-elidable memory wiping.
 *
 * C++ Core + C ABI Architecture
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "polymac/core/security.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace polymac {
namespace internal {

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#include <intrin.h>
#define COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

#ifdef _WIN32
    SecureZeroMemory(ptr, len);
#else
    secure_zero_ptr(ptr, len);
#endif

    COMPILER_BARRIER();
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    // Always iterate through all bytes
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

// ============================================================================
// Constant-Time Operations
// ============================================================================

uint32_t ct_select_u32(uint32_t condition, uint32_t a, uint32_t b) {
    // All 0s if condition is 0, all 1s otherwise
    uint32_t mask = static_cast<uint32_t>(-static_cast<int32_t>(condition != 0));
    return (b & mask) | (a & ~mask);
}

}  // namespace internal
}  // namespace polymac

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void polymac_secure_zero(void* ptr, size_t len) {
    polymac::internal::secure_zero(ptr, len);
}

int polymac_secure_compare(const void* a, const void* b, size_t len) {
    return polymac::internal::secure_compare(a, b, len) ? 1 : 0;
}

uint32_t polymac_ct_select_u32(uint32_t condition, uint32_t a, uint32_t b) {
    return polymac::internal::ct_select_u32(condition, a, b);
}

}  // extern "C"
