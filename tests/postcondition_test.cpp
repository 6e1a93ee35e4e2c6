#define RADIXDIV_ENABLE_POSTCONDITION_CHECKS
#include <stdexcept>
#include <type_traits>

#include <radixdiv/radixdiv.h>
#include <gtest/gtest.h>

#include "test_support.h"

using radixdiv::uint128;

static_assert(!noexcept(radixdiv::divrem(uint128(0), std::declval<const radixdiv::divisor_record &>())),
              "checked divrem must be allowed to throw");

TEST(Postcondition, HoldsForEveryTableRecord)
{
    const auto samples = test_support::sample_dividends(123, 300);
    for (const radixdiv::divisor_record & record : radixdiv::divisor_table())
    {
        for (uint128 n : samples)
            EXPECT_NO_THROW(radixdiv::divrem(n, record)) << "radix " << record.radix();
    }
}

// A record with a wrong multiplier is only caught once the identity breaks.
TEST(Postcondition, CorruptedMultiplierThrows)
{
    const uint64_t divisor = 10000000000000000000ULL;
    const auto bad = radixdiv::divisor_record::make_moderate(10, 19, divisor, radixdiv::moderate_constants{1, 0});

    EXPECT_NO_THROW(radixdiv::divrem(12345, bad));
    EXPECT_THROW(radixdiv::divrem(uint128(1) << 100, bad), std::logic_error);
    EXPECT_THROW(radixdiv::divrem(~uint128(0), bad), std::logic_error);
}

TEST(Postcondition, CorruptedSlowRecordThrows)
{
    // leading_zeros must normalize the divisor; 5 leaves it unnormalized.
    const auto bad = radixdiv::divisor_record::make_slow(3, 40, 12157665459056928801ULL, radixdiv::slow_constants{5});
    EXPECT_THROW(radixdiv::divrem(~uint128(0), bad), std::logic_error);
}
