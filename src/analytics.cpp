// =============================================================================
// analytics.cpp - Current range amounts and fee-implied volatility
// =============================================================================

#include "clamm/analytics.hpp"
#include "clamm/tick_math.hpp"

#include <cmath>

namespace clamm {

namespace {

struct RangeSqrtPrices {
    double sa;
    double sb;
};

RangeSqrtPrices current_range_sqrt_prices(int32_t current_tick, int32_t tick_spacing) {
    int32_t bottom_tick = tick_math::floor_to_spacing(current_tick, tick_spacing);
    int32_t top_tick = bottom_tick + tick_spacing;
    return {tick_math::tick_to_sqrt_price(bottom_tick),
            tick_math::tick_to_sqrt_price(top_tick)};
}

} // namespace

TokenAmounts current_range_amounts(U128 liquidity, int32_t current_tick,
                                   int32_t tick_spacing, double current_sqrt_price) {
    if (!(current_sqrt_price > 0.0)) {
        throw DomainError("Current sqrt price must be positive");
    }
    RangeSqrtPrices range = current_range_sqrt_prices(current_tick, tick_spacing);
    double l = wide::to_double(liquidity);
    double sp = current_sqrt_price;

    TokenAmounts amounts;
    amounts.amount0 = l * (range.sb - sp) / (sp * range.sb);
    amounts.amount1 = l * (sp - range.sa);
    return amounts;
}

double current_range_value0(U128 liquidity, int32_t current_tick, int32_t tick_spacing) {
    RangeSqrtPrices range = current_range_sqrt_prices(current_tick, tick_spacing);
    return wide::to_double(liquidity) * (range.sb - range.sa) / (range.sa * range.sb);
}

double fee_tier_to_rate(uint32_t fee_tier) noexcept {
    return static_cast<double>(fee_tier) / fees::FEE_DENOMINATOR;
}

double implied_volatility(double fee_rate, double daily_volume, double locked_value) {
    if (!(locked_value > 0.0)) {
        throw DomainError("Locked value must be positive to estimate volatility");
    }
    if (daily_volume < 0.0) {
        throw DomainError("Daily volume cannot be negative");
    }
    return 2.0 * fee_rate * std::sqrt(daily_volume / locked_value) *
           std::sqrt(DAYS_PER_YEAR);
}

std::vector<VolatilityPoint> implied_volatility_series(double fee_rate,
                                                       const std::vector<DailyVolume>& days,
                                                       double locked_value) {
    std::vector<VolatilityPoint> series;
    if (days.size() < 2) {
        return series;
    }
    series.reserve(days.size() - 1);

    // Skip index 0 (the day still in progress) and emit oldest first
    for (size_t i = days.size() - 1; i >= 1; --i) {
        const DailyVolume& day = days[i];
        series.push_back({day.date, day.volume,
                          implied_volatility(fee_rate, day.volume, locked_value)});
    }
    return series;
}

} // namespace clamm
