/**
 * @file version.h
 * @brief Unified Version Information for polymac Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef POLYMAC_VERSION_H
#define POLYMAC_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define POLYMAC_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define POLYMAC_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define POLYMAC_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define POLYMAC_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define POLYMAC_VERSION_NUMBER ((POLYMAC_VERSION_MAJOR * 10000) + \
                                (POLYMAC_VERSION_MINOR * 100) + \
                                POLYMAC_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define POLYMAC_RELEASE_DATE "2026-10-19"

/** Library name */
#define POLYMAC_LIBRARY_NAME "polymac"

/** Full library description */
#define POLYMAC_DESCRIPTION "Poly1305 One-Time Authenticator"

/** Build type identifier */
#ifdef NDEBUG
#define POLYMAC_BUILD_TYPE "Release"
#else
#define POLYMAC_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define POLYMAC_VERSION_AT_LEAST(major, minor, patch) \
    (POLYMAC_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* POLYMAC_VERSION_H */
