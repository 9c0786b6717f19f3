#ifndef CLAMM_DISTRIBUTION_HPP
#define CLAMM_DISTRIBUTION_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "types.hpp"
#include "wide_int.hpp"

namespace clamm {

// tick index -> signed liquidityNet (change in active liquidity when the
// price crosses the tick upward)
using TickDeltaMap = std::map<int32_t, I128>;

// =============================================================================
// Range Placement
// =============================================================================

enum class RangePlacement : uint8_t {
    BelowPrice = 0,   // Range lies below the current price: token1 only
    Current = 1,      // Range contains the current price: both tokens
    AbovePrice = 2    // Range lies above the current price: token0 only
};

const char* to_string(RangePlacement placement) noexcept;

// =============================================================================
// Per-Range Amounts
// =============================================================================

struct RangeAmounts {
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity;             // Active liquidity in [tick_lower, tick_upper)
    RangePlacement placement;

    // Amounts actually locked in the range
    double locked0;
    double locked1;

    // What the locked asset would be worth if fully swapped across the range.
    // Informational; never part of the totals. Zero for the current range.
    double potential0;
    double potential1;

    bool has_liquidity() const { return liquidity != 0; }
};

// Amounts for the range [tick_lower, tick_lower + tick_spacing)
RangeAmounts range_amounts(int32_t tick_lower, int32_t tick_spacing, I128 liquidity,
                           int32_t current_range_lower, double current_sqrt_price);

// =============================================================================
// Distribution
// =============================================================================

struct Distribution {
    std::vector<RangeAmounts> ranges;   // Ascending by tick_lower
    int32_t tick_spacing = 0;
    int32_t current_range_lower = 0;
    I128 current_liquidity = 0;         // Accumulator at the current range
    double total0 = 0.0;
    double total1 = 0.0;

    size_t range_count() const { return ranges.size(); }

    // nullptr when the current range lies outside the swept domain
    const RangeAmounts* current_range() const;
};

// Sweep every spacing-sized range from the lowest to the highest populated
// tick, starting the accumulator at zero. Liquidity values are relative:
// they equal absolute liquidity only when the map covers every initialized
// tick of the pool.
// Throws DomainError for non-positive spacing or price, and for a current tick
// or tick delta key outside [MIN_TICK, MAX_TICK].
Distribution aggregate_range_distribution(const TickDeltaMap& tick_deltas,
                                          int32_t current_tick,
                                          int32_t tick_spacing,
                                          double current_price);

// Same sweep, anchored at the pool's reported liquidity for the current range
// and walked outward in both directions. The domain is widened to include the
// current range.
Distribution aggregate_range_distribution_anchored(const TickDeltaMap& tick_deltas,
                                                   int32_t current_tick,
                                                   int32_t tick_spacing,
                                                   double current_price,
                                                   U128 pool_liquidity);

} // namespace clamm

#endif // CLAMM_DISTRIBUTION_HPP
