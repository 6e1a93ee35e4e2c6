#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <radixdiv/config.h>
#include <radixdiv/wide.h>

namespace radixdiv
{

constexpr unsigned min_radix = 2;
constexpr unsigned max_radix = 36;
constexpr uint64_t u64_max = std::numeric_limits<uint64_t>::max();
constexpr uint128 u128_max = ~uint128(0);

namespace detail
{
inline void require_radix(unsigned radix)
{
    RADIXDIV_REQUIRE(radix >= min_radix && radix <= max_radix, std::out_of_range, "radix must be in [2, 36]");
}

inline uint128 ipow(uint64_t base, unsigned exp) noexcept
{
    uint128 result = 1;
    while (exp--)
        result *= base;
    return result;
}
} // namespace detail

inline bool is_power_of_two(uint64_t v) noexcept
{
    return v != 0 && (v & (v - 1)) == 0;
}

//=== Power finder ===========================================================
// A power of the radix is usable as one division step when it fits in a
// limb and (2^128 - 1) / x^2 < x. The product cannot overflow once the first
// clause holds.
inline bool is_valid_power(uint128 x) noexcept
{
    if (x == 0 || x > u64_max)
        return false;
    return u128_max / (x * x) < x;
}

// Largest d with radix^d valid. The floating-point logarithm only seeds the
// search one exponent low; the exact test walks up past the maximum and the
// result steps back once.
inline unsigned find_power(unsigned radix)
{
    detail::require_radix(radix);
    const double estimate = std::floor(std::log(static_cast<double>(u64_max)) / std::log(static_cast<double>(radix)));
    unsigned power = estimate > 2.0 ? static_cast<unsigned>(estimate) - 1 : 1;
    uint128 candidate = detail::ipow(radix, power);
    while (is_valid_power(candidate))
    {
        candidate *= radix;
        ++power;
    }
    return power - 1;
}

//=== Multiplier chooser =====================================================
struct multiplier_choice
{
    uint256 multiplier;
    unsigned post_shift;
    unsigned divisor_bits;

    // multiplier < 2^width
    bool fits(unsigned width) const noexcept { return multiplier.bit_width() <= width; }
};

// Granlund & Montgomery, "Division by Invariant Integers using
// Multiplication" (PLDI '94), figure 6.2. The returned multiplier may need
// bits + 1 bits; callers decide what to do when it does not fit.
inline multiplier_choice choose_multiplier(uint64_t divisor, unsigned bits, bool is_signed = false)
{
    RADIXDIV_REQUIRE(divisor != 0, std::domain_error, "division by zero");
    RADIXDIV_REQUIRE(bits > 0 && bits <= 128, std::invalid_argument, "bits must be in [1, 128]");
    RADIXDIV_REQUIRE(!is_signed || bits > 1, std::invalid_argument, "signed precision needs at least 2 bits");

    const unsigned precision = is_signed ? bits - 1 : bits;
    // ceil(log2(divisor))
    const unsigned divisor_bits = detail::bit_width64(divisor - 1);
    unsigned post_shift = divisor_bits;

    const uint256 numerator = uint256::pow2(bits + divisor_bits);
    uint256 m_low = numerator / divisor;
    uint256 m_high = (numerator + uint256::pow2(bits + divisor_bits - precision)) / divisor;

    while ((m_low >> 1) < (m_high >> 1) && post_shift > 0)
    {
        m_low >>= 1;
        m_high >>= 1;
        --post_shift;
    }
    return {m_high, post_shift, divisor_bits};
}

//=== Shift detection ========================================================
// Trailing zero bits of the divisor: shifting dividend and divisor right by
// this much loses nothing from the quotient.
inline unsigned fast_shift(uint64_t divisor)
{
    RADIXDIV_REQUIRE(divisor != 0, std::domain_error, "division by zero");
    return static_cast<unsigned>(__builtin_ctzll(divisor));
}

// Normalization shift for the long-division fallback.
inline unsigned leading_zero_count(uint64_t divisor)
{
    RADIXDIV_REQUIRE(divisor != 0, std::domain_error, "division by zero");
    return static_cast<unsigned>(__builtin_clzll(divisor));
}

} // namespace radixdiv
