// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_CONFIG_HPP
#define PERSEVERE_CONFIG_HPP

// Version information
#define PERSEVERE_VERSION_MAJOR 0
#define PERSEVERE_VERSION_MINOR 1
#define PERSEVERE_VERSION_PATCH 0
#define PERSEVERE_VERSION_STRING "0.1.0"

// C++ standard detection
#if defined(_MSVC_LANG)
    #define PERSEVERE_CPLUSPLUS _MSVC_LANG
#else
    #define PERSEVERE_CPLUSPLUS __cplusplus
#endif

#if PERSEVERE_CPLUSPLUS < 202002L
    #error "Persevere requires C++20"
#endif

// Coroutine support detection
#include <version>
#if defined(__cpp_impl_coroutine) && defined(__cpp_lib_coroutine)
    #define PERSEVERE_HAS_COROUTINES 1
    #include <coroutine>
    namespace persevere {
        using std::coroutine_handle;
        using std::suspend_always;
        using std::suspend_never;
        using std::noop_coroutine;
    }
#elif __has_include(<experimental/coroutine>)
    #define PERSEVERE_HAS_COROUTINES 1
    #define PERSEVERE_EXPERIMENTAL_COROUTINES 1
    #include <experimental/coroutine>
    namespace persevere {
        using std::experimental::coroutine_handle;
        using std::experimental::suspend_always;
        using std::experimental::suspend_never;
        using std::experimental::noop_coroutine;
    }
#endif

#if !defined(PERSEVERE_HAS_COROUTINES)
    #error "Persevere requires coroutine support. Compile with -std=c++20 (GCC 10 also needs -fcoroutines)"
#endif

// Compiler detection
#if defined(_MSC_VER)
    #define PERSEVERE_MSVC 1
#elif defined(__clang__)
    #define PERSEVERE_CLANG 1
#elif defined(__GNUC__)
    #define PERSEVERE_GCC 1
#endif

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #define PERSEVERE_WINDOWS 1
#elif defined(__linux__)
    #define PERSEVERE_LINUX 1
#elif defined(__APPLE__)
    #define PERSEVERE_MACOS 1
#endif

// Utility macros
#define PERSEVERE_NODISCARD [[nodiscard]]
#define PERSEVERE_MAYBE_UNUSED [[maybe_unused]]

// Assert configuration
#ifndef PERSEVERE_ASSERT
    #include <cassert>
    #define PERSEVERE_ASSERT(cond) assert(cond)
#endif

// Retry policy defaults. Define before including any Persevere header to override.
#ifndef PERSEVERE_DEFAULT_MAX_ATTEMPTS
    #define PERSEVERE_DEFAULT_MAX_ATTEMPTS 3
#endif

#ifndef PERSEVERE_DEFAULT_ATTEMPT_TIMEOUT_MS
    #define PERSEVERE_DEFAULT_ATTEMPT_TIMEOUT_MS 30000
#endif

#ifndef PERSEVERE_DEFAULT_BACKOFF_STEP_MS
    #define PERSEVERE_DEFAULT_BACKOFF_STEP_MS 100
#endif

// Environment variable read by the default log backend
#ifndef PERSEVERE_LOG_LEVEL_ENV
    #define PERSEVERE_LOG_LEVEL_ENV "PERSEVERE_LOG_LEVEL"
#endif

#endif // PERSEVERE_CONFIG_HPP
