#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <radixdiv/wide.h>

namespace test_support
{

using boost::multiprecision::cpp_int;
using radixdiv::uint128;

inline uint128 make_u128(uint64_t hi, uint64_t lo)
{
    return (static_cast<uint128>(hi) << 64) | lo;
}

inline cpp_int to_cpp_int(uint128 v)
{
    cpp_int r = static_cast<uint64_t>(v >> 64);
    r <<= 64;
    r |= static_cast<uint64_t>(v);
    return r;
}

template <size_t Bits>
inline cpp_int to_cpp_int(const radixdiv::wide_uint<Bits> & v)
{
    cpp_int r = 0;
    for (size_t i = radixdiv::wide_uint<Bits>::limbs; i-- > 0;)
    {
        r <<= 64;
        r |= v.limb(i);
    }
    return r;
}

// Boundary values followed by random values of uniformly random bit width,
// so small dividends are as common as full-width ones.
inline std::vector<uint128> sample_dividends(uint64_t seed, size_t random_count)
{
    const uint128 max = ~uint128(0);
    const uint128 two64 = uint128(1) << 64;
    std::vector<uint128> out = {
        0,
        1,
        2,
        max,
        max - 1,
        two64 - 1,
        two64,
        two64 + 1,
        uint128(1) << 127,
        (uint128(1) << 127) - 1,
    };

    std::mt19937_64 rng(seed);
    for (size_t i = 0; i < random_count; ++i)
    {
        const unsigned width = 1 + static_cast<unsigned>(rng() % 128);
        uint128 v = make_u128(rng(), rng());
        if (width < 128)
            v &= (uint128(1) << width) - 1;
        out.push_back(v);
    }
    return out;
}

} // namespace test_support
