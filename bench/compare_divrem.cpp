#include <chrono>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include <radixdiv/radixdiv.h>

using radixdiv::uint128;

static constexpr size_t ITERATIONS = 100000;

static uint64_t g_seed = 0;

template <typename Op>
static long long measure(const std::vector<uint128> & data, Op op)
{
    radixdiv::divrem_result r{0, 0};
    auto start = std::chrono::steady_clock::now();
    for (uint128 n : data)
    {
        benchmark::DoNotOptimize(n);
        r = op(n);
        benchmark::DoNotOptimize(r);
    }
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
}

// Random values of random bit width, so both narrow and wide dividends occur.
static std::vector<uint128> generate_inputs(uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::vector<uint128> data;
    data.reserve(ITERATIONS);
    for (size_t i = 0; i < ITERATIONS; ++i)
    {
        const unsigned width = 1 + static_cast<unsigned>(rng() % 128);
        uint128 v = (static_cast<uint128>(rng()) << 64) | rng();
        if (width < 128)
            v &= (uint128(1) << width) - 1;
        data.push_back(v);
    }
    return data;
}

static void run_radix(unsigned radix)
{
    const radixdiv::divisor_record & record = radixdiv::record_for(radix);
    const uint128 d = record.divisor();
    const auto data = generate_inputs(g_seed + radix);

    auto table_ns = measure(data, [&record](uint128 n) { return radixdiv::divrem(n, record); });
    auto native_ns = measure(data, [d](uint128 n) { return radixdiv::divrem_result{n / d, static_cast<uint64_t>(n % d)}; });
    fmt::print(
        "radix={:>2} tier={:<12} table={}ns native={}ns ratio={:.2f}\n",
        radix,
        radixdiv::tier_name(record.kind()),
        table_ns,
        native_ns,
        static_cast<double>(table_ns) / native_ns);
}

int main(int argc, char ** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);
        if (arg.find("--seed=") == 0)
            g_seed = static_cast<uint64_t>(std::stoull(arg.substr(7)));
    }
    fmt::print("seed={}\n", g_seed);

    for (unsigned radix = radixdiv::min_radix; radix <= radixdiv::max_radix; ++radix)
        run_radix(radix);
    return 0;
}
