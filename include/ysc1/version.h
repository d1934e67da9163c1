/**
 * @file version.h
 * @brief Unified Version Information for the ysc1 Library
 *
 * This is the single source of truth for all version information.
 * When releasing a new version, only modify this file.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef YSC1_VERSION_H
#define YSC1_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define YSC1_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define YSC1_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define YSC1_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define YSC1_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define YSC1_VERSION_NUMBER ((YSC1_VERSION_MAJOR * 10000) + \
                             (YSC1_VERSION_MINOR * 100) + \
                             YSC1_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define YSC1_RELEASE_DATE "2026-10-19"

/** Library name */
#define YSC1_LIBRARY_NAME "ysc1"

/** Full library description */
#define YSC1_DESCRIPTION "YSC1 Lai-Massey Stream Cipher"

/** Build type identifier */
#ifdef NDEBUG
#define YSC1_BUILD_TYPE "Release"
#else
#define YSC1_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define YSC1_VERSION_AT_LEAST(major, minor, patch) \
    (YSC1_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* YSC1_VERSION_H */
