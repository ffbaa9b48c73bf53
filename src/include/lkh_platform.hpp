#pragma once
/**
 * @file lkh_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (LOCKHUB_PLATFORM_LINUX, LOCKHUB_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || defined(_WIN64)

#define LOCKHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))

#define LOCKHUB_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)

#define LOCKHUB_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX) || defined(__linux__)

#define LOCKHUB_PLATFORM_LINUX 1

#else

#define LOCKHUB_PLATFORM_UNKNOWN 1

#endif

// Convenience booleans for source code usage:
#if defined(LOCKHUB_PLATFORM_WIN64)
#define LOCKHUB_IS_WINDOWS 1
#undef LOCKHUB_IS_POSIX
#elif defined(LOCKHUB_PLATFORM_APPLE) || defined(LOCKHUB_PLATFORM_FREEBSD) ||                      \
    defined(LOCKHUB_PLATFORM_LINUX)
#undef LOCKHUB_IS_WINDOWS
#define LOCKHUB_IS_POSIX 1
#else
#undef LOCKHUB_IS_WINDOWS
#undef LOCKHUB_IS_POSIX
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

#include "lockhub_utils_export.h"

namespace lockhub::platform
{

/// Current process id.
LOCKHUB_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging and debugging; uses the cheapest OS-specific call.
 */
LOCKHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Name of the running executable.
 * @param include_path If true, return the full absolute path instead of the file name.
 * @return The name (or path), or "unknown" if it cannot be determined.
 */
LOCKHUB_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

} // namespace lockhub::platform
