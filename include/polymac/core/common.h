/**
 * @file common.h
 * @brief Common definitions and utility macros for polymac library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef POLYMAC_CORE_COMMON_H
#define POLYMAC_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define POLYMAC_PLATFORM_WINDOWS 1
    #define POLYMAC_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define POLYMAC_PLATFORM_LINUX 1
    #define POLYMAC_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define POLYMAC_PLATFORM_MACOS 1
    #define POLYMAC_PLATFORM_NAME "macOS"
#else
    #define POLYMAC_PLATFORM_UNKNOWN 1
    #define POLYMAC_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef POLYMAC_PLATFORM_WINDOWS
    #ifdef POLYMAC_SHARED_LIBRARY
        #ifdef POLYMAC_BUILDING
            #define POLYMAC_API __declspec(dllexport)
        #else
            #define POLYMAC_API __declspec(dllimport)
        #endif
    #else
        #define POLYMAC_API
    #endif
#else
    #ifdef POLYMAC_SHARED_LIBRARY
        #define POLYMAC_API __attribute__((visibility("default")))
    #else
        #define POLYMAC_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    POLYMAC_SUCCESS = 0,
    POLYMAC_ERROR_INVALID_PARAM = -1,
    POLYMAC_ERROR_BUFFER_TOO_SMALL = -2,
    POLYMAC_ERROR_INVALID_KEY_LENGTH = -3,  // Key is not exactly 32 bytes
    POLYMAC_ERROR_AUTH_FAILED = -4,         // Tag verification failed
    POLYMAC_ERROR_INTERNAL = -5
} polymac_error_t;

// Poly1305 sizes
#define POLYMAC_POLY1305_KEY_SIZE   32
#define POLYMAC_POLY1305_BLOCK_SIZE 16
#define POLYMAC_POLY1305_TAG_SIZE   16

// Utility macros
#define POLYMAC_MIN(a, b) ((a) < (b) ? (a) : (b))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
POLYMAC_API const char* polymac_error_string(polymac_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
POLYMAC_API const char* polymac_version(void);

/**
 * @brief Name of the platform the library was built for
 */
POLYMAC_API const char* polymac_platform(void);

#ifdef __cplusplus
}
#endif

#endif // POLYMAC_CORE_COMMON_H
