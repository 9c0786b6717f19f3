// =============================================================================
// distribution.cpp - Locked-asset distribution across the price axis
// =============================================================================

#include "clamm/distribution.hpp"
#include "clamm/tick_math.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace clamm {

namespace {

// Fold deltas into the spacing-aligned range containing each tick. Ticks off
// the grid contribute to the range they fall in.
TickDeltaMap bucket_deltas(const TickDeltaMap& tick_deltas, int32_t tick_spacing) {
    TickDeltaMap buckets;
    for (const auto& [tick, delta] : tick_deltas) {
        buckets[tick_math::floor_to_spacing(tick, tick_spacing)] += delta;
    }
    return buckets;
}

I128 bucket_at(const TickDeltaMap& buckets, int32_t tick) {
    auto it = buckets.find(tick);
    return it != buckets.end() ? it->second : I128(0);
}

double current_sqrt_price_of(double current_price) {
    if (!(current_price > 0.0) || !std::isfinite(current_price)) {
        throw DomainError("Current price must be positive and finite");
    }
    return std::sqrt(current_price);
}

// Ticks and spacing must stay inside the tick domain so range arithmetic
// cannot overflow int32
void check_tick_domain(const TickDeltaMap& tick_deltas, int32_t current_tick,
                       int32_t tick_spacing) {
    if (tick_spacing <= 0 || tick_spacing > tick_math::MAX_TICK - tick_math::MIN_TICK) {
        throw DomainError("Tick spacing out of range: " + std::to_string(tick_spacing));
    }
    if (!tick_math::is_valid_tick(current_tick)) {
        throw DomainError("Current tick out of range: " + std::to_string(current_tick));
    }
    if (tick_deltas.empty()) {
        return;
    }
    // Keys are ordered, so the ends bound every tick in the map
    for (int32_t tick : {tick_deltas.begin()->first, tick_deltas.rbegin()->first}) {
        if (!tick_math::is_valid_tick(tick)) {
            throw DomainError("Tick delta outside the valid tick range: " +
                              std::to_string(tick));
        }
    }
}

void add_to_totals(Distribution& dist, const RangeAmounts& range) {
    dist.total0 += range.locked0;
    dist.total1 += range.locked1;
}

} // namespace

const char* to_string(RangePlacement placement) noexcept {
    switch (placement) {
        case RangePlacement::BelowPrice: return "below_price";
        case RangePlacement::Current: return "current";
        case RangePlacement::AbovePrice: return "above_price";
    }
    return "unknown";
}

RangeAmounts range_amounts(int32_t tick_lower, int32_t tick_spacing, I128 liquidity,
                           int32_t current_range_lower, double current_sqrt_price) {
    RangeAmounts range{};
    range.tick_lower = tick_lower;
    range.tick_upper = tick_lower + tick_spacing;
    range.liquidity = liquidity;

    double sa = tick_math::tick_to_sqrt_price(range.tick_lower);
    double sb = tick_math::tick_to_sqrt_price(range.tick_upper);
    double l = wide::to_double(liquidity);

    if (tick_lower < current_range_lower) {
        // Price has moved past the range: only token1 is locked
        range.placement = RangePlacement::BelowPrice;
        range.locked1 = l * (sb - sa);
        range.potential0 = range.locked1 / (sb * sa);
    } else if (tick_lower == current_range_lower) {
        // Split at the actual current price, not the range boundary
        double sp = current_sqrt_price;
        range.placement = RangePlacement::Current;
        range.locked0 = l * (sb - sp) / (sp * sb);
        range.locked1 = l * (sp - sa);
    } else {
        // Price has not reached the range: only token0 is locked
        range.placement = RangePlacement::AbovePrice;
        range.potential1 = l * (sb - sa);
        range.locked0 = range.potential1 / (sb * sa);
    }
    return range;
}

const RangeAmounts* Distribution::current_range() const {
    auto it = std::lower_bound(ranges.begin(), ranges.end(), current_range_lower,
        [](const RangeAmounts& r, int32_t tick) { return r.tick_lower < tick; });
    if (it == ranges.end() || it->tick_lower != current_range_lower) {
        return nullptr;
    }
    return &*it;
}

Distribution aggregate_range_distribution(const TickDeltaMap& tick_deltas,
                                          int32_t current_tick,
                                          int32_t tick_spacing,
                                          double current_price) {
    check_tick_domain(tick_deltas, current_tick, tick_spacing);

    Distribution dist;
    dist.tick_spacing = tick_spacing;
    dist.current_range_lower = tick_math::floor_to_spacing(current_tick, tick_spacing);
    double sp = current_sqrt_price_of(current_price);

    if (tick_deltas.empty()) {
        return dist;
    }

    TickDeltaMap buckets = bucket_deltas(tick_deltas, tick_spacing);
    int32_t min_tick = buckets.begin()->first;
    int32_t max_tick = buckets.rbegin()->first;

    dist.ranges.reserve(static_cast<size_t>((max_tick - min_tick) / tick_spacing) + 1);

    I128 liquidity = 0;
    for (int32_t tick = min_tick; tick <= max_tick; tick += tick_spacing) {
        liquidity += bucket_at(buckets, tick);
        if (tick == dist.current_range_lower) {
            dist.current_liquidity = liquidity;
        }

        RangeAmounts range = range_amounts(tick, tick_spacing, liquidity,
                                           dist.current_range_lower, sp);
        add_to_totals(dist, range);
        dist.ranges.push_back(range);
    }

    // Current range beyond the populated domain: everything below it applies
    if (dist.current_range_lower > max_tick) {
        dist.current_liquidity = liquidity;
    }
    return dist;
}

Distribution aggregate_range_distribution_anchored(const TickDeltaMap& tick_deltas,
                                                   int32_t current_tick,
                                                   int32_t tick_spacing,
                                                   double current_price,
                                                   U128 pool_liquidity) {
    check_tick_domain(tick_deltas, current_tick, tick_spacing);

    Distribution dist;
    dist.tick_spacing = tick_spacing;
    dist.current_range_lower = tick_math::floor_to_spacing(current_tick, tick_spacing);
    dist.current_liquidity = static_cast<I128>(pool_liquidity);
    double sp = current_sqrt_price_of(current_price);

    TickDeltaMap buckets = bucket_deltas(tick_deltas, tick_spacing);
    int32_t min_tick = dist.current_range_lower;
    int32_t max_tick = dist.current_range_lower;
    if (!buckets.empty()) {
        min_tick = std::min(min_tick, buckets.begin()->first);
        max_tick = std::max(max_tick, buckets.rbegin()->first);
    }

    size_t count = static_cast<size_t>((max_tick - min_tick) / tick_spacing) + 1;
    size_t current_index = static_cast<size_t>(
        (dist.current_range_lower - min_tick) / tick_spacing);

    std::vector<I128> liquidity(count, 0);
    liquidity[current_index] = dist.current_liquidity;

    // Upward: crossing a range's lower tick adds its delta
    for (size_t i = current_index + 1; i < count; ++i) {
        int32_t tick = min_tick + static_cast<int32_t>(i) * tick_spacing;
        liquidity[i] = liquidity[i - 1] + bucket_at(buckets, tick);
    }
    // Downward: leaving a range through its lower tick removes that delta
    for (size_t i = current_index; i > 0; --i) {
        int32_t tick = min_tick + static_cast<int32_t>(i) * tick_spacing;
        liquidity[i - 1] = liquidity[i] - bucket_at(buckets, tick);
    }

    dist.ranges.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        int32_t tick = min_tick + static_cast<int32_t>(i) * tick_spacing;
        RangeAmounts range = range_amounts(tick, tick_spacing, liquidity[i],
                                           dist.current_range_lower, sp);
        add_to_totals(dist, range);
        dist.ranges.push_back(range);
    }
    return dist;
}

} // namespace clamm
