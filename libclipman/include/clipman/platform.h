/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for clipman
 *
 * This header provides compile-time platform detection and defines
 * the appropriate macros for cross-platform development.
 *
 * The system clipboard backend is Linux-only; the engine itself is
 * portable to any POSIX target.
 */

#ifndef CLIPMAN_PLATFORM_H
#define CLIPMAN_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define CLIPMAN_PLATFORM_LINUX 1
#define CLIPMAN_PLATFORM_NAME "Linux"
#elif defined(__unix__) || defined(__APPLE__)
#define CLIPMAN_PLATFORM_POSIX 1
#define CLIPMAN_PLATFORM_NAME "POSIX"
#else
#error "Unsupported platform. clipman requires a POSIX system."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define CLIPMAN_COMPILER_CLANG 1
#define CLIPMAN_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define CLIPMAN_COMPILER_GCC 1
#define CLIPMAN_COMPILER_NAME "GCC"
#else
#define CLIPMAN_COMPILER_UNKNOWN 1
#define CLIPMAN_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef CLIPMAN_BUILDING_SHARED
#define CLIPMAN_API __attribute__((visibility("default")))
#else
#define CLIPMAN_API
#endif

#define CLIPMAN_LOCAL __attribute__((visibility("hidden")))

// ============================================================================
// Utility Macros
// ============================================================================

#define CLIPMAN_UNUSED(x) (void)(x)

#define CLIPMAN_LIKELY(x) __builtin_expect(!!(x), 1)
#define CLIPMAN_UNLIKELY(x) __builtin_expect(!!(x), 0)

// ============================================================================
// Debug/Release Detection
// ============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
#define CLIPMAN_DEBUG 1
#else
#define CLIPMAN_RELEASE 1
#endif

// ============================================================================
// Feature Detection
// ============================================================================

// Desktop clipboard through wl-clipboard / xclip / xsel
#if defined(CLIPMAN_PLATFORM_LINUX)
#define CLIPMAN_HAS_SYSTEM_CLIPBOARD 1
#endif

#endif // CLIPMAN_PLATFORM_H
