/**
 * @file export.cpp
 * @brief Library version and error reporting functions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "polymac/polymac.h"

extern "C" {

const char* polymac_version(void) {
    return POLYMAC_VERSION_STRING;
}

const char* polymac_platform(void) {
    return POLYMAC_PLATFORM_NAME;
}

const char* polymac_error_string(polymac_error_t error) {
    switch (error) {
        case POLYMAC_SUCCESS:
            return "Success";
        case POLYMAC_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case POLYMAC_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case POLYMAC_ERROR_INVALID_KEY_LENGTH:
            return "Invalid key length";
        case POLYMAC_ERROR_AUTH_FAILED:
            return "Authentication failed";
        case POLYMAC_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

}  // extern "C"
