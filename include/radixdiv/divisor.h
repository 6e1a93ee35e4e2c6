#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <radixdiv/config.h>
#include <radixdiv/constants.h>
#include <radixdiv/wide.h>

namespace radixdiv
{

struct divrem_result;
class divisor_record;

inline divrem_result divrem(uint128 n, const divisor_record & record) RADIXDIV_NOEXCEPT_UNLESS_CHECKED;

//=== Tiers and their constants ==============================================
enum class tier : uint8_t
{
    power_of_two,
    fast,
    moderate,
    slow,
};

inline const char * tier_name(tier t) noexcept
{
    switch (t)
    {
        case tier::power_of_two:
            return "power_of_two";
        case tier::fast:
            return "fast";
        case tier::moderate:
            return "moderate";
        case tier::slow:
            return "slow";
    }
    return "unknown";
}

struct pow2_constants
{
    uint64_t mask;
    unsigned shift;
};

struct fast_constants
{
    unsigned fast_shift;
    // 2^(64 + fast_shift): dividends below this take the narrow division.
    uint128 fast_limit;
    uint128 multiplier;
    unsigned multiplier_shift;
};

struct moderate_constants
{
    uint128 multiplier;
    unsigned multiplier_shift;
};

struct slow_constants
{
    unsigned leading_zeros;
};

//=== Divisor record =========================================================
// Constants for dividing by radix^digit_count. Exactly one payload is live,
// selected by kind(); the accessors for the other three throw.
class divisor_record
{
public:
    static divisor_record make_power_of_two(unsigned radix, unsigned digits, const pow2_constants & c) noexcept
    {
        divisor_record record(radix, digits, 0, tier::power_of_two);
        record.payload_.pow2 = c;
        return record;
    }

    static divisor_record make_fast(unsigned radix, unsigned digits, uint64_t divisor, const fast_constants & c) noexcept
    {
        divisor_record record(radix, digits, divisor, tier::fast);
        record.payload_.fast = c;
        return record;
    }

    static divisor_record make_moderate(unsigned radix, unsigned digits, uint64_t divisor, const moderate_constants & c) noexcept
    {
        divisor_record record(radix, digits, divisor, tier::moderate);
        record.payload_.moderate = c;
        return record;
    }

    static divisor_record make_slow(unsigned radix, unsigned digits, uint64_t divisor, const slow_constants & c) noexcept
    {
        divisor_record record(radix, digits, divisor, tier::slow);
        record.payload_.slow = c;
        return record;
    }

    unsigned radix() const noexcept { return radix_; }
    unsigned digit_count() const noexcept { return digits_; }
    tier kind() const noexcept { return kind_; }

    // radix^digit_count. Power-of-two radices can reach 2^64, so the value is
    // widened; the multiplicative tiers always fit in a limb.
    uint128 divisor() const noexcept
    {
        if (kind_ == tier::power_of_two)
            return uint128(1) << payload_.pow2.shift;
        return divisor_;
    }

    const pow2_constants & pow2() const
    {
        expect(tier::power_of_two);
        return payload_.pow2;
    }

    const fast_constants & fast() const
    {
        expect(tier::fast);
        return payload_.fast;
    }

    const moderate_constants & moderate() const
    {
        expect(tier::moderate);
        return payload_.moderate;
    }

    const slow_constants & slow() const
    {
        expect(tier::slow);
        return payload_.slow;
    }

    friend divrem_result divrem(uint128 n, const divisor_record & record) RADIXDIV_NOEXCEPT_UNLESS_CHECKED;

private:
    union payload
    {
        pow2_constants pow2;
        fast_constants fast;
        moderate_constants moderate;
        slow_constants slow;
    };

    divisor_record(unsigned radix, unsigned digits, uint64_t divisor, tier kind) noexcept
        : radix_(radix)
        , digits_(digits)
        , divisor_(divisor)
        , kind_(kind)
    {
    }

    void expect(tier t) const
    {
        RADIXDIV_REQUIRE(kind_ == t, std::logic_error, "divisor record payload does not match its tier");
    }

    unsigned radix_;
    unsigned digits_;
    uint64_t divisor_;
    tier kind_;
    payload payload_{};
};

//=== Tier classification ====================================================
inline divisor_record classify(unsigned radix)
{
    detail::require_radix(radix);

    // Powers of two need no multiplier: a shift and a mask are exact.
    if (is_power_of_two(radix))
    {
        const unsigned log2 = static_cast<unsigned>(__builtin_ctzll(radix));
        const unsigned digits = 64 / log2;
        const unsigned shift = digits * log2;
        const uint64_t mask = shift >= 64 ? ~uint64_t(0) : (uint64_t(1) << shift) - 1;
        return divisor_record::make_power_of_two(radix, digits, pow2_constants{mask, shift});
    }

    const unsigned digits = find_power(radix);
    const uint64_t divisor = static_cast<uint64_t>(detail::ipow(radix, digits));
    const unsigned shift = fast_shift(divisor);
    const multiplier_choice choice = choose_multiplier(divisor, 128);

    // No 128-bit multiplier reaches the required precision.
    if (!choice.fits(128))
        return divisor_record::make_slow(radix, digits, divisor, slow_constants{leading_zero_count(divisor)});

    const uint128 multiplier = static_cast<uint128>(choice.multiplier);
    if (shift != 0)
    {
        const uint128 fast_limit = uint128(1) << (64 + shift);
        return divisor_record::make_fast(radix, digits, divisor, fast_constants{shift, fast_limit, multiplier, choice.post_shift});
    }
    return divisor_record::make_moderate(radix, digits, divisor, moderate_constants{multiplier, choice.post_shift});
}

//=== Constant table =========================================================
namespace detail
{
template <size_t... I>
struct index_sequence
{
};

template <size_t N, size_t... I>
struct make_index_sequence : make_index_sequence<N - 1, N - 1, I...>
{
};

template <size_t... I>
struct make_index_sequence<0, I...>
{
    using type = index_sequence<I...>;
};

constexpr size_t radix_count = max_radix - min_radix + 1;

using table_type = std::array<divisor_record, radix_count>;

template <size_t... I>
table_type make_table(index_sequence<I...>)
{
    return table_type{{classify(static_cast<unsigned>(min_radix + I))...}};
}
} // namespace detail

// One record per radix in [2, 36], index radix - 2. Built on first use and
// never modified, so concurrent readers need no synchronization.
inline const std::array<divisor_record, detail::radix_count> & divisor_table()
{
    static const detail::table_type table = detail::make_table(typename detail::make_index_sequence<detail::radix_count>::type());
    return table;
}

inline const divisor_record & record_for(unsigned radix)
{
    detail::require_radix(radix);
    return divisor_table()[radix - min_radix];
}

inline unsigned digits_per_step(unsigned radix)
{
    return record_for(radix).digit_count();
}

} // namespace radixdiv
