#pragma once

/// @file config.hpp
/// @author Aleksandr Loshkarev
/// @brief Configuration macros for the pulljson library.
///
/// Controls:
///   - Branch prediction hints
///   - Recursion depth limit
///   - Rollback window for delimiter skipping

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define PULLJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define PULLJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define PULLJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define PULLJSON_LIKELY(x)   (x)
    #define PULLJSON_UNLIKELY(x) (x)
    #define PULLJSON_NOINLINE    __declspec(noinline)
#else
    #define PULLJSON_LIKELY(x)   (x)
    #define PULLJSON_UNLIKELY(x) (x)
    #define PULLJSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Nested objects/arrays deeper than this fail with
// errc::max_depth_exceeded instead of exhausting the call stack.

#if !defined(PULLJSON_MAX_DEPTH)
    #define PULLJSON_MAX_DEPTH 512
#endif

// =====================================================================
// Rollback window (in characters) for Cursor::mark_and_skip_to()
// =====================================================================
// A skip that consumes more characters than this cannot be rolled back
// when the target is never found.

#if !defined(PULLJSON_SKIP_LIMIT)
    #define PULLJSON_SKIP_LIMIT 1000000
#endif
