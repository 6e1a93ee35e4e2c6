#include <benchmark/benchmark.h>
#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstdint>
#include <random>

#include <radixdiv/radixdiv.h>

using radixdiv::uint128;
using BInt = boost::multiprecision::uint128_t;

namespace
{

constexpr size_t kDataN = 256; // small deterministic dataset per case
constexpr uint64_t kSeedBase = 0x9E3779B97F4A7C15ull;

inline uint128 make_u128(uint64_t hi, uint64_t lo)
{
    return (static_cast<uint128>(hi) << 64) | lo;
}

const std::array<uint128, kDataN> & full_width_data()
{
    static const std::array<uint128, kDataN> data = []
    {
        std::array<uint128, kDataN> d{};
        std::mt19937_64 rng(kSeedBase);
        for (size_t i = 0; i < kDataN; ++i)
            d[i] = make_u128(rng(), rng());
        return d;
    }();
    return data;
}

// Values just above 2^64, where the fast tier takes its narrow path.
const std::array<uint128, kDataN> & narrow_data()
{
    static const std::array<uint128, kDataN> data = []
    {
        std::array<uint128, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0xA55AAA5512345678ull);
        for (size_t i = 0; i < kDataN; ++i)
            d[i] = make_u128(rng() & 0xFFFF, rng());
        return d;
    }();
    return data;
}

struct TableDivider
{
    static radixdiv::divrem_result run(uint128 n, const radixdiv::divisor_record & record)
    {
        return radixdiv::divrem(n, record);
    }
};

struct NativeDivider
{
    static radixdiv::divrem_result run(uint128 n, const radixdiv::divisor_record & record)
    {
        const uint128 d = record.divisor();
        return {n / d, static_cast<uint64_t>(n % d)};
    }
};

struct BoostDivider
{
    static radixdiv::divrem_result run(uint128 n, const radixdiv::divisor_record & record)
    {
        BInt big = static_cast<uint64_t>(n >> 64);
        big <<= 64;
        big |= static_cast<uint64_t>(n);
        BInt q;
        BInt r;
        boost::multiprecision::divide_qr(big, divisor_of(record), q, r);
        return {make_u128(static_cast<uint64_t>(q >> 64), static_cast<uint64_t>(q)), static_cast<uint64_t>(r)};
    }

    static BInt divisor_of(const radixdiv::divisor_record & record)
    {
        const uint128 d = record.divisor();
        BInt big = static_cast<uint64_t>(d >> 64);
        big <<= 64;
        big |= static_cast<uint64_t>(d);
        return big;
    }
};

} // namespace

template <typename Divider>
static void DivRem_FullWidth(benchmark::State & state)
{
    const radixdiv::divisor_record & record = radixdiv::record_for(static_cast<unsigned>(state.range(0)));
    const auto & data = full_width_data();
    size_t i = 0;
    for (auto _ : state)
    {
        uint128 n = data[i++ & (kDataN - 1)];
        benchmark::DoNotOptimize(n);
        auto r = Divider::run(n, record);
        benchmark::DoNotOptimize(r);
    }
    state.SetLabel(radixdiv::tier_name(record.kind()));
}

template <typename Divider>
static void DivRem_Narrow(benchmark::State & state)
{
    const radixdiv::divisor_record & record = radixdiv::record_for(static_cast<unsigned>(state.range(0)));
    const auto & data = narrow_data();
    size_t i = 0;
    for (auto _ : state)
    {
        uint128 n = data[i++ & (kDataN - 1)];
        benchmark::DoNotOptimize(n);
        auto r = Divider::run(n, record);
        benchmark::DoNotOptimize(r);
    }
    state.SetLabel(radixdiv::tier_name(record.kind()));
}

// One radix per tier: 16 power of two, 10 fast, 7 moderate, 3 slow.
#define REG_RADICES(Func, Divider) BENCHMARK_TEMPLATE(Func, Divider)->Arg(16)->Arg(10)->Arg(7)->Arg(3)

REG_RADICES(DivRem_FullWidth, TableDivider);
REG_RADICES(DivRem_FullWidth, NativeDivider);
REG_RADICES(DivRem_FullWidth, BoostDivider);
REG_RADICES(DivRem_Narrow, TableDivider);
REG_RADICES(DivRem_Narrow, NativeDivider);

static void ToString_Radix(benchmark::State & state)
{
    const unsigned radix = static_cast<unsigned>(state.range(0));
    const auto & data = full_width_data();
    size_t i = 0;
    for (auto _ : state)
    {
        auto s = radixdiv::to_string(data[i++ & (kDataN - 1)], radix);
        benchmark::DoNotOptimize(s);
    }
}

BENCHMARK(ToString_Radix)->Arg(2)->Arg(10)->Arg(16)->Arg(36)->Arg(3);

BENCHMARK_MAIN();
