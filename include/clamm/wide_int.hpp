#ifndef CLAMM_WIDE_INT_HPP
#define CLAMM_WIDE_INT_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace clamm {

// =============================================================================
// 128-bit Integers
// =============================================================================

// On-chain liquidity is uint128 and liquidityNet is int128; neither fits in
// 64 bits, so records are parsed into these before any floating-point math.
using I128 = __int128;
using U128 = unsigned __int128;

// =============================================================================
// 256-bit Unsigned (two U128 limbs)
// =============================================================================

// Holds sqrtPriceX96, which is a uint160 on chain.
struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

namespace wide {

// Decimal string parsing. Throws RecordError on empty input, stray
// characters or overflow.
U128 parse_u128(std::string_view s);
I128 parse_i128(std::string_view s);
U256 parse_u256(std::string_view s);

double to_double(U128 v) noexcept;
double to_double(I128 v) noexcept;
double to_double(const U256& v) noexcept;

std::string to_string(U128 v);
std::string to_string(I128 v);

// Maximum representable values
constexpr U128 U128_MAX = ~U128(0);
constexpr I128 I128_MAX = static_cast<I128>(U128_MAX >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

} // namespace wide

} // namespace clamm

#endif // CLAMM_WIDE_INT_HPP
