#ifndef CLAMM_TYPES_HPP
#define CLAMM_TYPES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace clamm {

// =============================================================================
// Errors
// =============================================================================

// Algebraic singularity: zero-width range, vanishing denominator, bad spacing
class DomainError : public std::runtime_error {
public:
    explicit DomainError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed or incomplete upstream record
class RecordError : public std::runtime_error {
public:
    explicit RecordError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Fee Tiers (hundredths of a bip)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_001 = 100;     // 0.01%
constexpr uint32_t FEE_005 = 500;     // 0.05%
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
constexpr uint32_t FEE_DENOMINATOR = 1000000;
}

// Standard tick spacings
namespace tick_spacings {
constexpr int32_t TICK_SPACING_001 = 1;
constexpr int32_t TICK_SPACING_005 = 10;
constexpr int32_t TICK_SPACING_030 = 60;
constexpr int32_t TICK_SPACING_100 = 200;
constexpr int32_t DEFAULT = TICK_SPACING_030;
}

// =============================================================================
// Token Amounts
// =============================================================================

struct TokenAmounts {
    double amount0 = 0.0;
    double amount1 = 0.0;

    TokenAmounts operator+(const TokenAmounts& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    TokenAmounts& operator+=(const TokenAmounts& other) {
        amount0 += other.amount0;
        amount1 += other.amount1;
        return *this;
    }
};

// Closed price interval [lower, upper]
struct PriceRange {
    double lower = 0.0;
    double upper = 0.0;
};

} // namespace clamm

#endif // CLAMM_TYPES_HPP
