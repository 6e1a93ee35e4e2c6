#include <stdexcept>

#include <radixdiv/constants.h>
#include <gtest/gtest.h>

using radixdiv::uint128;

TEST(PowerFinder, DecimalUsesNineteenDigits)
{
    EXPECT_EQ(radixdiv::find_power(10), 19u);
}

TEST(PowerFinder, KnownExponents)
{
    EXPECT_EQ(radixdiv::find_power(3), 40u);
    EXPECT_EQ(radixdiv::find_power(7), 22u);
    EXPECT_EQ(radixdiv::find_power(19), 15u);
    EXPECT_EQ(radixdiv::find_power(35), 12u);
    EXPECT_EQ(radixdiv::find_power(36), 12u);
}

// The chosen exponent is the exact edge of the validity region.
TEST(PowerFinder, ExponentIsValidityBoundary)
{
    for (unsigned radix = radixdiv::min_radix; radix <= radixdiv::max_radix; ++radix)
    {
        const unsigned d = radixdiv::find_power(radix);
        uint128 power = 1;
        for (unsigned i = 0; i < d; ++i)
            power *= radix;
        EXPECT_TRUE(radixdiv::is_valid_power(power)) << "radix " << radix;
        EXPECT_FALSE(radixdiv::is_valid_power(power * radix)) << "radix " << radix;
        EXPECT_LE(power, uint128(radixdiv::u64_max)) << "radix " << radix;
    }
}

TEST(PowerFinder, ValidityRejectsSmallAndLargeValues)
{
    EXPECT_FALSE(radixdiv::is_valid_power(0));
    EXPECT_FALSE(radixdiv::is_valid_power(1));
    EXPECT_FALSE(radixdiv::is_valid_power(uint128(1) << 42));
    EXPECT_TRUE(radixdiv::is_valid_power(radixdiv::u64_max));
    EXPECT_FALSE(radixdiv::is_valid_power(uint128(radixdiv::u64_max) + 1));
}

// x^3 > 2^128 - 1 starts just above 2^(128/3).
TEST(PowerFinder, ValidityCubeThreshold)
{
    // 6981463658331^3 < 2^128 - 1 < 6981463658332^3
    EXPECT_FALSE(radixdiv::is_valid_power(6981463658331ULL));
    EXPECT_TRUE(radixdiv::is_valid_power(6981463658332ULL));
}

TEST(PowerFinder, RadixOutOfRangeThrows)
{
    EXPECT_THROW(radixdiv::find_power(0), std::out_of_range);
    EXPECT_THROW(radixdiv::find_power(1), std::out_of_range);
    EXPECT_THROW(radixdiv::find_power(37), std::out_of_range);
}
