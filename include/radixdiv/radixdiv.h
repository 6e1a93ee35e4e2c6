#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#ifdef RADIXDIV_ENABLE_FMT
#    include <fmt/format.h>
#endif

#include <radixdiv/config.h>
#include <radixdiv/constants.h>
#include <radixdiv/divisor.h>
#include <radixdiv/divrem.h>
#include <radixdiv/wide.h>

namespace radixdiv
{

//=== Radix formatting =======================================================
// Writes value in the given radix by peeling off digit_count digits per
// division: each remainder is one chunk, rendered zero-padded except for
// the most significant.
inline std::string to_string(uint128 value, unsigned radix = 10)
{
    const divisor_record & record = record_for(radix);
    if (value == 0)
        return "0";

    static const char digit_chars[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    const unsigned chunk_digits = record.digit_count();

    std::vector<uint64_t> chunks;
    chunks.reserve(128 / chunk_digits + 1);
    while (value != 0)
    {
        const divrem_result step = divrem(value, record);
        chunks.push_back(step.remainder);
        value = step.quotient;
    }

    std::string out;
    out.reserve(chunks.size() * chunk_digits);
    char buf[64];
    for (auto it = chunks.rbegin(); it != chunks.rend(); ++it)
    {
        uint64_t x = *it;
        unsigned idx = 64;
        while (x)
        {
            buf[--idx] = digit_chars[x % radix];
            x /= radix;
        }
        // Inner chunks keep their leading zeros.
        if (it != chunks.rbegin())
        {
            while (64 - idx < chunk_digits)
                buf[--idx] = '0';
        }
        out.append(buf + idx, 64 - idx);
    }
    return out;
}

//=== Diagnostics ============================================================
inline std::string describe(const divisor_record & record)
{
    std::string out = "radix=" + std::to_string(record.radix());
    out += " tier=";
    out += tier_name(record.kind());
    out += " digits=" + std::to_string(record.digit_count());
    out += " divisor=" + to_string(record.divisor());
    switch (record.kind())
    {
        case tier::power_of_two:
            out += " shift=" + std::to_string(record.pow2().shift);
            out += " mask=" + to_string(record.pow2().mask);
            break;
        case tier::fast:
            out += " fast_shift=" + std::to_string(record.fast().fast_shift);
            out += " multiplier=" + to_string(record.fast().multiplier);
            out += " multiplier_shift=" + std::to_string(record.fast().multiplier_shift);
            break;
        case tier::moderate:
            out += " multiplier=" + to_string(record.moderate().multiplier);
            out += " multiplier_shift=" + std::to_string(record.moderate().multiplier_shift);
            break;
        case tier::slow:
            out += " leading_zeros=" + std::to_string(record.slow().leading_zeros);
            break;
    }
    return out;
}

inline std::ostream & operator<<(std::ostream & out, tier t)
{
    return out << tier_name(t);
}

inline std::ostream & operator<<(std::ostream & out, const divisor_record & record)
{
    return out << describe(record);
}

} // namespace radixdiv

#ifdef RADIXDIV_ENABLE_FMT
namespace fmt
{
template <>
struct formatter<radixdiv::tier>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(radixdiv::tier value, FormatContext & ctx) const -> typename FormatContext::iterator
    {
        return fmt::format_to(ctx.out(), "{}", radixdiv::tier_name(value));
    }
};

template <>
struct formatter<radixdiv::divisor_record>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const radixdiv::divisor_record & value, FormatContext & ctx) const -> typename FormatContext::iterator
    {
        return fmt::format_to(ctx.out(), "{}", radixdiv::describe(value));
    }
};
} // namespace fmt
#endif
