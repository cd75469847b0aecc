#pragma once

// Platform and build-mode macros of stack-array.
// Everything here is consumed by the library itself, there is no general-purpose macro toolbox.

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================
//
// SA_COMPILER_MSVC   - MSVC (cl.exe, not clang-cl)
// SA_COMPILER_POSIX  - gcc or clang, i.e. __attribute__ syntax is available
// SA_OS_LINUX        - debugger detection reads /proc (see assert.cc)

#if defined(_MSC_VER) && !defined(__clang__)
#define SA_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define SA_COMPILER_POSIX
#else
#error "stack-array supports msvc, gcc and clang"
#endif

#if defined(__linux__)
#define SA_OS_LINUX
#endif

// =========================================================================================================
// Build modes
// =========================================================================================================
//
// CMake defines exactly one of SA_DEBUG, SA_RELEASE, SA_RELWITHDEBINFO.
// SA_ASSERT_ENABLED is 1 unless this is a release build without SA_ENABLE_ASSERT_IN_RELEASE.
// It only affects SA_ASSERT; capacity and bounds checks are never compiled out.

#ifndef SA_ASSERT_ENABLED
#if defined(SA_RELEASE) && !defined(SA_ENABLE_ASSERT_IN_RELEASE)
#define SA_ASSERT_ENABLED 0
#else
#define SA_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Function attributes
// =========================================================================================================

#if defined(SA_COMPILER_MSVC)
#define SA_FORCE_INLINE __forceinline
#define SA_COLD_FUNC
#else
// gcc wants the extra 'inline' next to always_inline
#define SA_FORCE_INLINE __attribute__((always_inline)) inline
#define SA_COLD_FUNC __attribute__((cold))
#endif

// Slot accessors of the inline storage: stepping into them stays possible in debug builds
#ifdef SA_DEBUG
#define SA_FORCE_INLINE_DEBUGGABLE inline
#else
#define SA_FORCE_INLINE_DEBUGGABLE SA_FORCE_INLINE
#endif

// =========================================================================================================
// Helpers
// =========================================================================================================

// token pasting after expansion, SA_DEFER uses it to name its guard after __COUNTER__
#define SA_MACRO_JOIN(a, b) SA_IMPL_MACRO_JOIN(a, b)
#define SA_IMPL_MACRO_JOIN(a, b) a##b

// type-checks expr without evaluating it (used by the stripped SA_ASSERT)
#define SA_UNUSED(expr) (void)(sizeof((expr)))
