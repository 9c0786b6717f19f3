#ifndef CLAMM_TICK_MATH_HPP
#define CLAMM_TICK_MATH_HPP

#include <cstdint>

#include "types.hpp"
#include "wide_int.hpp"

namespace clamm {

// =============================================================================
// Tick Math Utilities
// =============================================================================

namespace tick_math {

// Each tick is a 0.01% price step
constexpr double TICK_BASE = 1.0001;

// Minimum and maximum ticks
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// Q64.96 denominator exponent
constexpr int Q96_BITS = 96;

// price = 1.0001^tick. Fractional ticks are accepted: tick / 2 yields the
// square root of the price.
double tick_to_price(double tick) noexcept;

// sqrt(price) at tick
double tick_to_sqrt_price(double tick) noexcept;

// Largest tick whose price does not exceed the given price.
// Throws DomainError for non-positive prices.
int32_t price_to_tick(double price);

// Fee tier -> tick spacing: 100 -> 1, 500 -> 10, 3000 -> 60, 10000 -> 200.
// Unknown tiers fall back to 60.
int32_t fee_tier_to_tick_spacing(uint32_t fee_tier) noexcept;

// Lower bound of the spacing-aligned range containing tick (floor division,
// so negative ticks round down). Throws DomainError for spacing <= 0.
int32_t floor_to_spacing(int32_t tick, int32_t tick_spacing);

// Rescale a Q64.96 sqrt price to a real sqrt price
double sqrt_price_from_x96(const U256& sqrt_price_x96) noexcept;

// Human-readable price: raw price / 10^(decimals1 - decimals0)
double adjust_price_for_decimals(double price, int decimals0, int decimals1) noexcept;

inline bool is_valid_tick(int32_t tick) noexcept {
    return tick >= MIN_TICK && tick <= MAX_TICK;
}

} // namespace tick_math

} // namespace clamm

#endif // CLAMM_TICK_MATH_HPP
