// =============================================================================
// wide_int.cpp - Decimal parsing and conversion for 128/256-bit integers
// =============================================================================

#include "clamm/wide_int.hpp"
#include "clamm/types.hpp"

#include <algorithm>
#include <cmath>

namespace clamm {
namespace wide {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

std::string quoted(std::string_view s) {
    return "'" + std::string(s) + "'";
}

int digit_value(char c, std::string_view s) {
    if (c < '0' || c > '9') {
        throw RecordError("Invalid decimal integer " + quoted(s));
    }
    return c - '0';
}

// v = v * 10 + d over two limbs; returns false on overflow
bool mul10_add(U256& v, unsigned d) {
    U128 p0 = (v.lo & MASK64) * 10;
    U128 p1 = (v.lo >> 64) * 10;
    U128 mid = (p0 >> 64) + (p1 & MASK64);
    U128 lo = (p0 & MASK64) | (mid << 64);
    U128 carry = (p1 >> 64) + (mid >> 64);

    if (v.hi > (U128_MAX - carry) / 10) return false;
    U128 hi = v.hi * 10 + carry;

    U128 sum = lo + d;
    if (sum < lo) {
        if (hi == U128_MAX) return false;
        ++hi;
    }
    v.lo = sum;
    v.hi = hi;
    return true;
}

} // namespace

U128 parse_u128(std::string_view s) {
    if (s.empty()) {
        throw RecordError("Empty decimal integer");
    }
    U128 v = 0;
    for (char c : s) {
        unsigned d = static_cast<unsigned>(digit_value(c, s));
        if (v > (U128_MAX - d) / 10) {
            throw RecordError("Integer " + quoted(s) + " overflows 128 bits");
        }
        v = v * 10 + d;
    }
    return v;
}

I128 parse_i128(std::string_view s) {
    bool negative = !s.empty() && s.front() == '-';
    std::string_view digits = negative ? s.substr(1) : s;
    if (digits.empty()) {
        throw RecordError("Invalid decimal integer " + quoted(s));
    }

    U128 magnitude = parse_u128(digits);
    const U128 limit = static_cast<U128>(I128_MAX) + (negative ? 1 : 0);
    if (magnitude > limit) {
        throw RecordError("Integer " + quoted(s) + " overflows signed 128 bits");
    }

    if (negative) {
        // -(2^127) has no positive counterpart
        if (magnitude == limit) return I128_MIN;
        return -static_cast<I128>(magnitude);
    }
    return static_cast<I128>(magnitude);
}

U256 parse_u256(std::string_view s) {
    if (s.empty()) {
        throw RecordError("Empty decimal integer");
    }
    U256 v;
    for (char c : s) {
        unsigned d = static_cast<unsigned>(digit_value(c, s));
        if (!mul10_add(v, d)) {
            throw RecordError("Integer " + quoted(s) + " overflows 256 bits");
        }
    }
    return v;
}

double to_double(U128 v) noexcept {
    return std::ldexp(static_cast<double>(static_cast<uint64_t>(v >> 64)), 64) +
           static_cast<double>(static_cast<uint64_t>(v & MASK64));
}

double to_double(I128 v) noexcept {
    if (v < 0) {
        // Negate in unsigned space so I128_MIN does not overflow
        return -to_double(static_cast<U128>(0) - static_cast<U128>(v));
    }
    return to_double(static_cast<U128>(v));
}

double to_double(const U256& v) noexcept {
    return std::ldexp(to_double(v.hi), 128) + to_double(v.lo);
}

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    if (v < 0) {
        return "-" + to_string(static_cast<U128>(0) - static_cast<U128>(v));
    }
    return to_string(static_cast<U128>(v));
}

} // namespace wide
} // namespace clamm
