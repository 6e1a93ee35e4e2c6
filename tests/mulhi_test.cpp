#include <cstdint>
#include <random>

#include <radixdiv/wide.h>
#include <gtest/gtest.h>

#include "test_support.h"

using radixdiv::uint128;
using test_support::cpp_int;
using test_support::make_u128;
using test_support::to_cpp_int;

TEST(MulHi128, Zero)
{
    const uint128 max = ~uint128(0);
    EXPECT_TRUE(radixdiv::mulhi(0, 0) == 0);
    EXPECT_TRUE(radixdiv::mulhi(0, max) == 0);
    EXPECT_TRUE(radixdiv::mulhi(max, 0) == 0);
}

TEST(MulHi128, MaxTimesMax)
{
    // (2^128 - 1)^2 = 2^256 - 2^129 + 1, whose high half is 2^128 - 2
    const uint128 max = ~uint128(0);
    EXPECT_TRUE(radixdiv::mulhi(max, max) == max - 1);
}

TEST(MulHi128, PowersOfTwo)
{
    for (unsigned a = 0; a < 128; a += 7)
    {
        for (unsigned b = 0; b < 128; b += 5)
        {
            const uint128 x = uint128(1) << a;
            const uint128 y = uint128(1) << b;
            const uint128 expected = a + b >= 128 ? uint128(1) << (a + b - 128) : 0;
            EXPECT_TRUE(radixdiv::mulhi(x, y) == expected) << "a=" << a << " b=" << b;
        }
    }
}

// The middle partial products both carry into the high half here.
TEST(MulHi128, CrossTermCarries)
{
    const uint128 x = make_u128(1, ~uint64_t(0));
    const uint128 y = make_u128(1, ~uint64_t(0));
    const cpp_int expected = (to_cpp_int(x) * to_cpp_int(y)) >> 128;
    EXPECT_EQ(to_cpp_int(radixdiv::mulhi(x, y)), expected);
}

TEST(MulHi128, RandomAgainstBoost)
{
    std::mt19937_64 rng(0x9E3779B97F4A7C15ull);
    for (int i = 0; i < 20000; ++i)
    {
        const uint128 x = make_u128(rng(), rng());
        const uint128 y = make_u128(rng(), rng());
        const cpp_int expected = (to_cpp_int(x) * to_cpp_int(y)) >> 128;
        ASSERT_EQ(to_cpp_int(radixdiv::mulhi(x, y)), expected);
    }
}

TEST(MulHi128, Commutative)
{
    std::mt19937_64 rng(42);
    for (int i = 0; i < 1000; ++i)
    {
        const uint128 x = make_u128(rng(), rng());
        const uint128 y = make_u128(rng() >> (i % 64), rng());
        EXPECT_TRUE(radixdiv::mulhi(x, y) == radixdiv::mulhi(y, x));
    }
}

TEST(MulHiWide, MatchesNativeWidthForm)
{
    std::mt19937_64 rng(7);
    for (int i = 0; i < 1000; ++i)
    {
        const uint128 x = make_u128(rng(), rng());
        const uint128 y = make_u128(rng(), rng());
        const radixdiv::wide_uint<128> wx = x;
        const radixdiv::wide_uint<128> wy = y;
        EXPECT_TRUE(static_cast<uint128>(radixdiv::mulhi(wx, wy)) == radixdiv::mulhi(x, y));
    }
}

TEST(MulHiWide, UInt256AgainstBoost)
{
    using U256 = radixdiv::uint256;
    std::mt19937_64 rng(11);
    for (int i = 0; i < 2000; ++i)
    {
        U256 x = U256(make_u128(rng(), rng())) << 128;
        x += U256(make_u128(rng(), rng()));
        U256 y = U256(make_u128(rng(), rng())) << 128;
        y += U256(make_u128(rng(), rng()));
        const cpp_int expected = (to_cpp_int(x) * to_cpp_int(y)) >> 256;
        ASSERT_EQ(to_cpp_int(radixdiv::mulhi(x, y)), expected);
    }
}

TEST(MulHiWide, UInt192AllOnes)
{
    using U192 = radixdiv::uint192;
    const U192 max = U192(-1);
    const cpp_int m = to_cpp_int(max);
    EXPECT_EQ(to_cpp_int(radixdiv::mulhi(max, max)), (m * m) >> 192);
}
