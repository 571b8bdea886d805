#pragma once

// Platform and build-mode detection shared by every pointer-core header
//
//   compiler:    PC_COMPILER_MSVC, PC_COMPILER_CLANG, PC_COMPILER_GCC, PC_COMPILER_POSIX (clang or gcc)
//   platform:    PC_OS_WINDOWS, PC_OS_APPLE, PC_OS_LINUX, PC_OS_BSD
//   build mode:  PC_ASSERT_ENABLED and PC_SHADOW_STATE_ENABLED, always defined as 0 or 1

#ifdef _MSC_VER
#define PC_COMPILER_MSVC
#elif defined(__clang__)
#define PC_COMPILER_CLANG
#define PC_COMPILER_POSIX
#elif defined(__GNUC__)
#define PC_COMPILER_GCC
#define PC_COMPILER_POSIX
#else
#error "pointer-core: unsupported compiler"
#endif

#ifdef _WIN32
#define PC_OS_WINDOWS
#elif defined(__APPLE__)
#define PC_OS_APPLE
#elif defined(__linux__)
#define PC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define PC_OS_BSD
#else
#error "pointer-core: unsupported platform"
#endif

// CMake passes one of PC_DEBUG, PC_RELWITHDEBINFO, PC_RELEASE.
// Plain compiler invocations fall back to NDEBUG, like assert() does.
#if defined(PC_DEBUG) || defined(PC_RELWITHDEBINFO) || defined(PC_ENABLE_ASSERT_IN_RELEASE)
#define PC_ASSERT_ENABLED 1
#elif defined(PC_RELEASE) || defined(NDEBUG)
#define PC_ASSERT_ENABLED 0
#else
#define PC_ASSERT_ENABLED 1
#endif

// changes the layout of nothing, but the library and its users must agree on it
// (the CMake target exports it as a PUBLIC definition)
#ifndef PC_SHADOW_STATE_ENABLED
#define PC_SHADOW_STATE_ENABLED PC_ASSERT_ENABLED
#endif

#ifdef PC_COMPILER_MSVC
#define PC_PRETTY_FUNC __FUNCSIG__
#define PC_FORCE_INLINE __forceinline
#define PC_COLD_FUNC
#else
#define PC_PRETTY_FUNC __PRETTY_FUNCTION__
// gcc ignores always_inline without the extra inline
#define PC_FORCE_INLINE __attribute__((always_inline)) inline
#define PC_COLD_FUNC __attribute__((cold))
#endif

#define PC_MACRO_JOIN(a, b) PC_IMPL_MACRO_JOIN(a, b)
#define PC_IMPL_MACRO_JOIN(a, b) a##b

// type-checks expr without evaluating it
#define PC_UNUSED(expr) (void)(sizeof((expr)))
