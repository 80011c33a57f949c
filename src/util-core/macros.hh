#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: UC_COMPILER_MSVC, UC_COMPILER_CLANG, UC_COMPILER_GCC, UC_COMPILER_MINGW, UC_COMPILER_POSIX

#if defined(_MSC_VER)
#define UC_COMPILER_MSVC
#elif defined(__clang__)
#define UC_COMPILER_CLANG
#elif defined(__GNUC__)
#define UC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define UC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(UC_COMPILER_CLANG) || defined(UC_COMPILER_GCC) || defined(UC_COMPILER_MINGW)
#define UC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: UC_DEBUG, UC_RELEASE, UC_RELWITHDEBINFO, UC_ASSERT_ENABLED

#ifndef UC_ASSERT_ENABLED
#if defined(UC_RELEASE) && !defined(UC_ENABLE_ASSERT_IN_RELEASE)
#define UC_ASSERT_ENABLED 0
#else
#define UC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: UC_OS_WINDOWS, UC_OS_LINUX, UC_OS_APPLE, UC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define UC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define UC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define UC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define UC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// UC_FORCE_INLINE - Force function to be inlined
#define UC_FORCE_INLINE UC_IMPL_FORCE_INLINE

// UC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: UC_COLD_FUNC void handle_error() { ... }
#define UC_COLD_FUNC UC_IMPL_COLD_FUNC

// UC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: UC_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define UC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(UC_COMPILER_MSVC)

#define UC_IMPL_FORCE_INLINE __forceinline
#define UC_IMPL_COLD_FUNC

#elif defined(UC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define UC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define UC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
