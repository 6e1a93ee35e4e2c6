#pragma once

#include <stdexcept>

#if defined(__GNUC__) || defined(__clang__)
#    define RADIXDIV_UNLIKELY(x) __builtin_expect(!!(x), 0)
#    define RADIXDIV_LIKELY(x) __builtin_expect(!!(x), 1)
#    define RADIXDIV_FORCE_INLINE inline __attribute__((always_inline))
#else
#    define RADIXDIV_UNLIKELY(x) (x)
#    define RADIXDIV_LIKELY(x) (x)
#    define RADIXDIV_FORCE_INLINE inline
#endif

#if __cplusplus >= 201402L
#    define RADIXDIV_CONSTEXPR14 constexpr
#else
#    define RADIXDIV_CONSTEXPR14
#endif

// Precondition checks on the offline (constant derivation) path are always on:
// a bad radix or divisor must never silently produce a table entry.
#define RADIXDIV_REQUIRE(cond, exception, msg) \
    do \
    { \
        if (RADIXDIV_UNLIKELY(!(cond))) \
            throw exception(msg); \
    } while (false)

// The runtime identity q * d + r == n, r < d is only verified on request.
#if defined(RADIXDIV_ENABLE_POSTCONDITION_CHECKS)
#    define RADIXDIV_NOEXCEPT_UNLESS_CHECKED
#    define RADIXDIV_POSTCONDITION(cond, msg) RADIXDIV_REQUIRE(cond, std::logic_error, msg)
#else
#    define RADIXDIV_NOEXCEPT_UNLESS_CHECKED noexcept
#    define RADIXDIV_POSTCONDITION(cond, msg) ((void)0)
#endif
