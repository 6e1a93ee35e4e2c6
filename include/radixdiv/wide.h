#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#ifdef RADIXDIV_ENABLE_FMT
#    include <fmt/format.h>
#endif

#include <radixdiv/config.h>

namespace radixdiv
{

//=== Forward declarations & type aliases ====================================
using uint128 = unsigned __int128;

template <size_t Bits>
class wide_uint;

using uint192 = wide_uint<192>;
using uint256 = wide_uint<256>;

//=== Internal helper utilities ==============================================
namespace detail
{
template <size_t Bits>
struct storage_count
{
    static_assert(Bits > 0, "Bits must be > 0");
    static_assert(Bits % 64 == 0, "Bits must be multiple of 64");
    static constexpr size_t value = Bits / 64;
};

// std::is_integral / std::is_signed do not cover __int128 in strict -std=c++11.
template <typename T>
struct is_integral : std::is_integral<T>
{
};

template <>
struct is_integral<__int128> : std::true_type
{
};

template <>
struct is_integral<unsigned __int128> : std::true_type
{
};

template <typename T>
struct is_signed : std::is_signed<T>
{
};

template <>
struct is_signed<__int128> : std::true_type
{
};

template <>
struct is_signed<unsigned __int128> : std::false_type
{
};

constexpr uint64_t lo64(uint128 v) noexcept
{
    return static_cast<uint64_t>(v);
}

constexpr uint64_t hi64(uint128 v) noexcept
{
    return static_cast<uint64_t>(v >> 64);
}

// Full 64x64->128 product; the only multiplication primitive used below.
constexpr uint128 mul64(uint64_t a, uint64_t b) noexcept
{
    return static_cast<uint128>(a) * b;
}

inline unsigned bit_width64(uint64_t v) noexcept
{
    return v ? 64u - static_cast<unsigned>(__builtin_clzll(v)) : 0u;
}

inline unsigned bit_width128(uint128 v) noexcept
{
    return hi64(v) ? 64u + bit_width64(hi64(v)) : bit_width64(lo64(v));
}

template <size_t L>
RADIXDIV_CONSTEXPR14 inline void add_limbs(uint64_t * lhs, const uint64_t * rhs) noexcept
{
    uint128 carry = 0;
    for (size_t i = 0; i < L; ++i)
    {
        uint128 sum = static_cast<uint128>(lhs[i]) + rhs[i] + carry;
        lhs[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }
}

template <size_t L>
RADIXDIV_CONSTEXPR14 inline void sub_limbs(uint64_t * lhs, const uint64_t * rhs) noexcept
{
    uint128 borrow = 0;
    for (size_t i = 0; i < L; ++i)
    {
        uint128 lhs_i = lhs[i];
        uint128 subtrahend = static_cast<uint128>(rhs[i]) + borrow;
        lhs[i] = static_cast<uint64_t>(lhs_i - subtrahend);
        borrow = lhs_i < subtrahend;
    }
}

// Schoolbook L x L limb product into 2L limbs. Each step adds a 64x64
// partial product plus two 64-bit terms, which stays below 2^128.
template <size_t L>
RADIXDIV_FORCE_INLINE void mul_limbs_full(uint64_t * res, const uint64_t * lhs, const uint64_t * rhs) noexcept
{
    for (size_t i = 0; i < 2 * L; ++i)
        res[i] = 0;
    for (size_t i = 0; i < L; ++i)
    {
        uint64_t carry = 0;
        for (size_t j = 0; j < L; ++j)
        {
            uint128 cur = mul64(lhs[i], rhs[j]) + res[i + j] + carry;
            res[i + j] = lo64(cur);
            carry = hi64(cur);
        }
        res[i + L] = carry;
    }
}
} // namespace detail

//=== High multiply ==========================================================
// High 128 bits of the exact 256-bit product x * y. Every operand is split
// into 64-bit limbs and only 64x64->128 partial products are formed, so no
// type wider than the operands is needed:
//   carry = hi(x_lo * y_lo)
//   m     = x_lo * y_hi + carry            (< 2^128)
//   high2 = hi(x_hi * y_lo + lo(m))        (< 2^128 before the shift)
//   result = x_hi * y_hi + hi(m) + high2
inline uint128 mulhi(uint128 x, uint128 y) noexcept
{
    const uint64_t x_lo = detail::lo64(x);
    const uint64_t x_hi = detail::hi64(x);
    const uint64_t y_lo = detail::lo64(y);
    const uint64_t y_hi = detail::hi64(y);

    const uint128 carry = detail::mul64(x_lo, y_lo) >> 64;
    const uint128 m = detail::mul64(x_lo, y_hi) + carry;
    const uint128 high1 = m >> 64;
    const uint128 high2 = (detail::mul64(x_hi, y_lo) + detail::lo64(m)) >> 64;
    return detail::mul64(x_hi, y_hi) + high1 + high2;
}

template <size_t Bits>
wide_uint<Bits> mulhi(const wide_uint<Bits> & x, const wide_uint<Bits> & y) noexcept;

//=== String and stream declarations =========================================
template <size_t Bits>
std::string to_string(const wide_uint<Bits> & value);

template <size_t Bits>
std::ostream & operator<<(std::ostream & out, const wide_uint<Bits> & value);

//=== Core wide unsigned type ================================================
// Fixed-width unsigned integer over little-endian 64-bit limbs. Only the
// operations the constant derivation needs are provided: add/sub with
// wraparound, shifts, comparisons and division by a single limb.
template <size_t Bits>
class wide_uint
{
public:
    static constexpr size_t limbs = detail::storage_count<Bits>::value;
    using limb_type = uint64_t;

    template <size_t B>
    friend wide_uint<B> mulhi(const wide_uint<B> & x, const wide_uint<B> & y) noexcept;

    constexpr wide_uint() noexcept = default;

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    wide_uint(T v) noexcept
    {
        assign(v);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    wide_uint & operator=(T v) noexcept
    {
        assign(v);
        return *this;
    }

    // 2^n, or zero when n does not fit.
    static wide_uint pow2(unsigned n) noexcept
    {
        wide_uint result;
        if (n < Bits)
            result.data_[n / 64] = limb_type(1) << (n % 64);
        return result;
    }

    // Truncating conversion to a native integer.
    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    explicit operator T() const noexcept
    {
        return static_cast<T>(low_u128());
    }

    explicit operator bool() const noexcept { return !is_zero(); }

    limb_type limb(size_t i) const noexcept { return i < limbs ? data_[i] : 0; }

    bool is_zero() const noexcept
    {
        for (size_t i = 0; i < limbs; ++i)
            if (data_[i] != 0)
                return false;
        return true;
    }

    int highest_bit() const noexcept
    {
        for (int i = static_cast<int>(limbs) - 1; i >= 0; --i)
        {
            if (data_[i])
                return i * 64 + 63 - __builtin_clzll(data_[i]);
        }
        return -1;
    }

    unsigned bit_width() const noexcept { return static_cast<unsigned>(highest_bit() + 1); }

    bool fits_u128() const noexcept { return bit_width() <= 128; }

    RADIXDIV_CONSTEXPR14 wide_uint & operator+=(const wide_uint & rhs) noexcept
    {
        detail::add_limbs<limbs>(data_, rhs.data_);
        return *this;
    }

    RADIXDIV_CONSTEXPR14 wide_uint & operator-=(const wide_uint & rhs) noexcept
    {
        detail::sub_limbs<limbs>(data_, rhs.data_);
        return *this;
    }

    // Non-positive shift amounts are no-ops; shifting by Bits or more clears.
    wide_uint & operator<<=(int n) noexcept
    {
        if (n <= 0)
            return *this;
        const size_t shift = static_cast<size_t>(n);
        if (shift >= Bits)
        {
            for (size_t i = 0; i < limbs; ++i)
                data_[i] = 0;
            return *this;
        }
        const size_t limb_shift = shift / 64;
        const unsigned bit_shift = shift % 64;
        if (limb_shift)
        {
            for (size_t i = limbs; i-- > limb_shift;)
                data_[i] = data_[i - limb_shift];
            for (size_t i = 0; i < limb_shift; ++i)
                data_[i] = 0;
        }
        if (bit_shift)
        {
            for (size_t i = limbs; i-- > 0;)
            {
                limb_type part = data_[i] << bit_shift;
                if (i)
                    part |= data_[i - 1] >> (64 - bit_shift);
                data_[i] = part;
            }
        }
        return *this;
    }

    wide_uint & operator>>=(int n) noexcept
    {
        if (n <= 0)
            return *this;
        const size_t shift = static_cast<size_t>(n);
        if (shift >= Bits)
        {
            for (size_t i = 0; i < limbs; ++i)
                data_[i] = 0;
            return *this;
        }
        const size_t limb_shift = shift / 64;
        const unsigned bit_shift = shift % 64;
        if (limb_shift)
        {
            for (size_t i = 0; i < limbs - limb_shift; ++i)
                data_[i] = data_[i + limb_shift];
            for (size_t i = limbs - limb_shift; i < limbs; ++i)
                data_[i] = 0;
        }
        if (bit_shift)
        {
            for (size_t i = 0; i < limbs; ++i)
            {
                limb_type part = data_[i] >> bit_shift;
                if (i + 1 < limbs)
                    part |= data_[i + 1] << (64 - bit_shift);
                data_[i] = part;
            }
        }
        return *this;
    }

    // Divide by a single limb; returns the remainder. quotient may alias *this.
    limb_type div_mod_small(limb_type div, wide_uint & quotient) const
    {
        RADIXDIV_REQUIRE(div != 0, std::domain_error, "division by zero");
        wide_uint q;
        uint128 rem = 0;
        for (size_t i = limbs; i-- > 0;)
        {
            const uint128 cur = (rem << 64) | data_[i];
            q.data_[i] = static_cast<limb_type>(cur / div);
            rem = cur % div;
        }
        quotient = q;
        return static_cast<limb_type>(rem);
    }

    friend wide_uint operator+(wide_uint lhs, const wide_uint & rhs) noexcept
    {
        lhs += rhs;
        return lhs;
    }

    friend wide_uint operator-(wide_uint lhs, const wide_uint & rhs) noexcept
    {
        lhs -= rhs;
        return lhs;
    }

    friend wide_uint operator<<(wide_uint lhs, int n) noexcept
    {
        lhs <<= n;
        return lhs;
    }

    friend wide_uint operator>>(wide_uint lhs, int n) noexcept
    {
        lhs >>= n;
        return lhs;
    }

    friend wide_uint operator/(const wide_uint & lhs, limb_type rhs)
    {
        wide_uint q;
        lhs.div_mod_small(rhs, q);
        return q;
    }

    friend limb_type operator%(const wide_uint & lhs, limb_type rhs)
    {
        wide_uint q;
        return lhs.div_mod_small(rhs, q);
    }

    friend bool operator==(const wide_uint & lhs, const wide_uint & rhs) noexcept
    {
        for (size_t i = 0; i < limbs; ++i)
            if (lhs.data_[i] != rhs.data_[i])
                return false;
        return true;
    }

    friend bool operator!=(const wide_uint & lhs, const wide_uint & rhs) noexcept { return !(lhs == rhs); }

    friend bool operator<(const wide_uint & lhs, const wide_uint & rhs) noexcept
    {
        for (size_t i = limbs; i-- > 0;)
        {
            if (lhs.data_[i] != rhs.data_[i])
                return lhs.data_[i] < rhs.data_[i];
        }
        return false;
    }

    friend bool operator>(const wide_uint & lhs, const wide_uint & rhs) noexcept { return rhs < lhs; }
    friend bool operator<=(const wide_uint & lhs, const wide_uint & rhs) noexcept { return !(rhs < lhs); }
    friend bool operator>=(const wide_uint & lhs, const wide_uint & rhs) noexcept { return !(lhs < rhs); }

private:
    template <typename T>
    void assign(T v) noexcept
    {
        // Signed values are sign-extended, matching native unsigned conversion.
        const bool negative = detail::is_signed<T>::value && v < 0;
        const uint128 wide = detail::is_signed<T>::value ? static_cast<uint128>(static_cast<__int128>(v)) : static_cast<uint128>(v);
        const limb_type fill = negative ? ~limb_type(0) : limb_type(0);
        data_[0] = detail::lo64(wide);
        for (size_t i = 1; i < limbs; ++i)
            data_[i] = i == 1 ? detail::hi64(wide) : fill;
    }

    uint128 low_u128() const noexcept
    {
        const uint128 hi = limbs > 1 ? data_[limbs > 1 ? 1 : 0] : 0;
        return (hi << 64) | data_[0];
    }

    limb_type data_[limbs] = {};
};

// Same limb splitting as the 128-bit form, widened to any limb count: the
// full 2L-limb product is formed and its upper L limbs are returned.
template <size_t Bits>
inline wide_uint<Bits> mulhi(const wide_uint<Bits> & x, const wide_uint<Bits> & y) noexcept
{
    constexpr size_t L = wide_uint<Bits>::limbs;
    uint64_t product[2 * L];
    detail::mul_limbs_full<L>(product, x.data_, y.data_);
    wide_uint<Bits> result;
    for (size_t i = 0; i < L; ++i)
        result.data_[i] = product[L + i];
    return result;
}

//=== String and stream definitions =========================================
template <size_t Bits>
inline std::string to_string(const wide_uint<Bits> & v)
{
    if (v.is_zero())
        return "0";

    using Int = wide_uint<Bits>;
    const typename Int::limb_type base = 10000000000000000000ULL; // 1e19
    const unsigned chunk_digits = 19;

    std::vector<typename Int::limb_type> chunks;
    chunks.reserve((Bits + 62) / 63);
    Int tmp = v;
    while (!tmp.is_zero())
        chunks.push_back(tmp.div_mod_small(base, tmp));

    std::string out;
    out.reserve(chunks.size() * chunk_digits);
    auto it = chunks.rbegin();
    out += std::to_string(*it);
    for (++it; it != chunks.rend(); ++it)
    {
        char buf[chunk_digits];
        typename Int::limb_type x = *it;
        for (unsigned i = chunk_digits; i-- > 0;)
        {
            buf[i] = static_cast<char>('0' + (x % 10));
            x /= 10;
        }
        out.append(buf, chunk_digits);
    }
    return out;
}

template <size_t Bits>
inline std::ostream & operator<<(std::ostream & out, const wide_uint<Bits> & value)
{
    return out << to_string(value);
}

} // namespace radixdiv

#ifdef RADIXDIV_ENABLE_FMT
namespace fmt
{
template <size_t Bits>
struct formatter<radixdiv::wide_uint<Bits>>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const radixdiv::wide_uint<Bits> & value, FormatContext & ctx) const -> typename FormatContext::iterator
    {
        return fmt::format_to(ctx.out(), "{}", radixdiv::to_string(value));
    }
};
} // namespace fmt
#endif
