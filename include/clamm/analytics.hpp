#ifndef CLAMM_ANALYTICS_HPP
#define CLAMM_ANALYTICS_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"
#include "wide_int.hpp"

namespace clamm {

// =============================================================================
// Current Range
// =============================================================================

// Virtual amounts of the pool's active liquidity inside the current
// spacing-aligned range, split at the current sqrt price
TokenAmounts current_range_amounts(U128 liquidity, int32_t current_tick,
                                   int32_t tick_spacing, double current_sqrt_price);

// Value of the current range's liquidity if it were held entirely as token0:
// L (sb - sa) / (sa sb)
double current_range_value0(U128 liquidity, int32_t current_tick, int32_t tick_spacing);

// =============================================================================
// Fee-Implied Volatility
// =============================================================================

struct DailyVolume {
    int64_t date = 0;       // Unix seconds at the start of the day
    double volume = 0.0;    // Traded volume, in the same unit as the locked value
};

struct VolatilityPoint {
    int64_t date = 0;
    double volume = 0.0;
    double implied_volatility = 0.0;   // Annualized, as a fraction
};

constexpr double DAYS_PER_YEAR = 365.0;

// Fee tier (hundredths of a bip) as a fraction: 3000 -> 0.003
double fee_tier_to_rate(uint32_t fee_tier) noexcept;

// IV = 2 * fee * sqrt(volume / locked) * sqrt(365)
// Throws DomainError when locked_value <= 0 or volume < 0.
double implied_volatility(double fee_rate, double daily_volume, double locked_value);

// IV for each day, oldest first. days is ordered newest first, as returned by
// the pool's day data; its first entry is the running day and is skipped.
std::vector<VolatilityPoint> implied_volatility_series(double fee_rate,
                                                       const std::vector<DailyVolume>& days,
                                                       double locked_value);

} // namespace clamm

#endif // CLAMM_ANALYTICS_HPP
