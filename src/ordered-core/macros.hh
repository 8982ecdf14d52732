#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: OC_COMPILER_MSVC, OC_COMPILER_CLANG, OC_COMPILER_GCC, OC_COMPILER_MINGW, OC_COMPILER_POSIX

#if defined(_MSC_VER)
#define OC_COMPILER_MSVC
#elif defined(__clang__)
#define OC_COMPILER_CLANG
#elif defined(__GNUC__)
#define OC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define OC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(OC_COMPILER_CLANG) || defined(OC_COMPILER_GCC) || defined(OC_COMPILER_MINGW)
#define OC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: OC_OS_WINDOWS, OC_OS_LINUX, OC_OS_APPLE, OC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define OC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define OC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define OC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: OC_DEBUG, OC_RELEASE, OC_RELWITHDEBINFO, OC_ENABLE_ASSERT_IN_RELEASE
// Always defined: OC_ASSERT_ENABLED (0 or 1)

#ifndef OC_ASSERT_ENABLED
#if defined(OC_DEBUG) || defined(OC_RELWITHDEBINFO) || defined(OC_ENABLE_ASSERT_IN_RELEASE)
#define OC_ASSERT_ENABLED 1
#else
#define OC_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// OC_FORCE_INLINE - Force function to be inlined
#define OC_FORCE_INLINE OC_IMPL_FORCE_INLINE

// OC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: OC_COLD_FUNC void handle_error() { ... }
#define OC_COLD_FUNC OC_IMPL_COLD_FUNC

// OC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define OC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(OC_COMPILER_MSVC)

#define OC_IMPL_FORCE_INLINE __forceinline
#define OC_IMPL_COLD_FUNC

#elif defined(OC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define OC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define OC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
