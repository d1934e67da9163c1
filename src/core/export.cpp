/**
 * @file export.cpp
 * @brief Library information exports
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "ysc1/core/common.h"
#include "ysc1/version.h"

extern "C" {

const char* ysc1_version(void) {
    return YSC1_VERSION_STRING;
}

const char* ysc1_platform(void) {
    return YSC1_PLATFORM_NAME;
}

const char* ysc1_error_string(ysc1_error_t error) {
    switch (error) {
        case YSC1_SUCCESS:
            return "Success";
        case YSC1_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case YSC1_ERROR_INVALID_KEY:
            return "Invalid key length";
        case YSC1_ERROR_INVALID_NONCE:
            return "Invalid nonce length";
        case YSC1_ERROR_NOT_SUPPORTED:
            return "Backend not supported";
        case YSC1_ERROR_COUNTER_EXHAUSTED:
            return "Block counter exhausted";
        case YSC1_ERROR_RANDOM_FAILED:
            return "Random number generation failed";
        case YSC1_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

}  // extern "C"
