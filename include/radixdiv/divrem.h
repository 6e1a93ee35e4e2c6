#pragma once

#include <cstdint>

#include <radixdiv/config.h>
#include <radixdiv/divisor.h>
#include <radixdiv/wide.h>

namespace radixdiv
{

struct divrem_result
{
    uint128 quotient;
    uint64_t remainder;
};

namespace detail
{
// Divide the two-limb value hi:lo by divisor, where hi < divisor so the
// quotient fits a limb. The divisor is first shifted left by leading_zeros
// so its top bit is set; the quotient is then built from two base-2^32
// digits, each estimated from the divisor's top half and corrected at most
// twice (Knuth, TAOCP vol. 2, 4.3.1, algorithm D with n = 2).
inline uint64_t div_2by1(uint64_t hi, uint64_t lo, uint64_t divisor, unsigned leading_zeros, uint64_t & remainder) noexcept
{
    const uint64_t base = uint64_t(1) << 32;
    const uint64_t half_mask = base - 1;
    const unsigned s = leading_zeros;

    const uint64_t v = divisor << s;
    const uint64_t vn1 = v >> 32;
    const uint64_t vn0 = v & half_mask;

    const uint64_t un32 = (hi << s) | (s ? lo >> (64 - s) : 0);
    const uint64_t un10 = lo << s;
    const uint64_t un1 = un10 >> 32;
    const uint64_t un0 = un10 & half_mask;

    uint64_t q1 = un32 / vn1;
    uint64_t rhat = un32 - q1 * vn1;
    while (q1 >= base || q1 * vn0 > ((rhat << 32) | un1))
    {
        --q1;
        rhat += vn1;
        if (rhat >= base)
            break;
    }

    // Wraps mod 2^64; the true value is below v.
    const uint64_t un21 = (un32 << 32) + un1 - q1 * v;

    uint64_t q0 = un21 / vn1;
    rhat = un21 - q0 * vn1;
    while (q0 >= base || q0 * vn0 > ((rhat << 32) | un0))
    {
        --q0;
        rhat += vn1;
        if (rhat >= base)
            break;
    }

    remainder = ((un21 << 32) + un0 - q0 * v) >> s;
    return (q1 << 32) | q0;
}
} // namespace detail

//=== Kernels ================================================================
inline divrem_result pow2_divrem(uint128 n, uint64_t mask, unsigned shift) noexcept
{
    return {n >> shift, static_cast<uint64_t>(n) & mask};
}

// Below fast_limit, n >> fast_shift fits a limb and only zero bits of the
// divisor are dropped, so a narrow division gives the exact quotient.
inline divrem_result fast_divrem(
    uint128 n, uint64_t divisor, uint128 fast_limit, unsigned fast_shift, uint128 multiplier, unsigned multiplier_shift) noexcept
{
    uint128 quotient;
    if (n < fast_limit)
        quotient = static_cast<uint64_t>(n >> fast_shift) / (divisor >> fast_shift);
    else
        quotient = mulhi(n, multiplier) >> multiplier_shift;
    return {quotient, static_cast<uint64_t>(n - quotient * divisor)};
}

inline divrem_result moderate_divrem(uint128 n, uint64_t divisor, uint128 multiplier, unsigned multiplier_shift) noexcept
{
    const uint128 quotient = mulhi(n, multiplier) >> multiplier_shift;
    return {quotient, static_cast<uint64_t>(n - quotient * divisor)};
}

inline divrem_result slow_divrem(uint128 n, uint64_t divisor, unsigned leading_zeros) noexcept
{
    const uint64_t hi = detail::hi64(n);
    const uint64_t lo = detail::lo64(n);
    if (hi == 0)
        return {lo / divisor, lo % divisor};

    const uint64_t q_hi = hi / divisor;
    uint64_t remainder = 0;
    const uint64_t q_lo = detail::div_2by1(hi % divisor, lo, divisor, leading_zeros, remainder);
    return {(static_cast<uint128>(q_hi) << 64) | q_lo, remainder};
}

//=== Dispatch ===============================================================
inline divrem_result divrem(uint128 n, const divisor_record & record) RADIXDIV_NOEXCEPT_UNLESS_CHECKED
{
    const uint64_t divisor = record.divisor_;
    divrem_result result{0, 0};
    switch (record.kind_)
    {
        case tier::power_of_two: {
            const pow2_constants & c = record.payload_.pow2;
            result = pow2_divrem(n, c.mask, c.shift);
            break;
        }
        case tier::fast: {
            const fast_constants & c = record.payload_.fast;
            result = fast_divrem(n, divisor, c.fast_limit, c.fast_shift, c.multiplier, c.multiplier_shift);
            break;
        }
        case tier::moderate: {
            const moderate_constants & c = record.payload_.moderate;
            result = moderate_divrem(n, divisor, c.multiplier, c.multiplier_shift);
            break;
        }
        case tier::slow:
            result = slow_divrem(n, divisor, record.payload_.slow.leading_zeros);
            break;
    }
    RADIXDIV_POSTCONDITION(
        result.remainder < record.divisor() && result.quotient * record.divisor() + result.remainder == n,
        "arithmetic inconsistency: quotient * divisor + remainder != dividend");
    return result;
}

inline divrem_result divrem(uint128 n, unsigned radix)
{
    return divrem(n, record_for(radix));
}

} // namespace radixdiv
