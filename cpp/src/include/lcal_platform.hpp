#pragma once
/**
 * @file lcal_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (LEAPCAL_PLATFORM_WIN64, LEAPCAL_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)

#define LEAPCAL_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)
#define LEAPCAL_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define LEAPCAL_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define LEAPCAL_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define LEAPCAL_PLATFORM_UNKNOWN 1

#else
// Fallback detection
#if defined(_WIN64)
#define LEAPCAL_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#define LEAPCAL_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define LEAPCAL_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define LEAPCAL_PLATFORM_LINUX 1
#else
#define LEAPCAL_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(LEAPCAL_PLATFORM_WIN64)
#define LEAPCAL_IS_WINDOWS 1
#elif defined(LEAPCAL_PLATFORM_APPLE) || defined(LEAPCAL_PLATFORM_FREEBSD) ||                      \
    defined(LEAPCAL_PLATFORM_LINUX)
#define LEAPCAL_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "leapcal_utils_export.h"

namespace leapcal::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
LEAPCAL_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the major version number of the leapcal package.
 * @return The major version (e.g., 1 from 1.0.7).
 */
LEAPCAL_UTILS_EXPORT int get_version_major() noexcept;
/**
 * @brief Gets the minor version number of the leapcal package.
 * @return The minor version (e.g., 0 from 1.0.7).
 */
LEAPCAL_UTILS_EXPORT int get_version_minor() noexcept;
/**
 * @brief Gets the rolling version number (e.g., from git commit count).
 * @return The rolling version (e.g., 7 from 1.0.7).
 */
LEAPCAL_UTILS_EXPORT int get_version_rolling() noexcept;
/**
 * @brief Gets the full version string (major.minor.rolling).
 * @return A string such as "1.0.7".
 */
LEAPCAL_UTILS_EXPORT const char *get_version_string() noexcept;

} // namespace leapcal::platform
