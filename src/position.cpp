// =============================================================================
// position.cpp - Position valuation at the current price
// =============================================================================

#include "clamm/position.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/tick_math.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace clamm {

PositionValue value_position(const Position& position, int32_t current_tick,
                             double current_sqrt_price) {
    if (position.tick_lower >= position.tick_upper) {
        throw DomainError("Position " + position.id + " has an empty tick range [" +
                          std::to_string(position.tick_lower) + ", " +
                          std::to_string(position.tick_upper) + ")");
    }

    double sa = tick_math::tick_to_sqrt_price(position.tick_lower);
    double sb = tick_math::tick_to_sqrt_price(position.tick_upper);
    double l = wide::to_double(position.liquidity);

    PositionValue value{position, RangePlacement::Current, 0.0, 0.0};

    if (position.tick_upper <= current_tick) {
        value.placement = RangePlacement::BelowPrice;
        value.amount1 = l * (sb - sa);
    } else if (position.tick_lower <= current_tick) {
        TokenAmounts amounts = liquidity_math::amounts_for_liquidity(
            l, current_sqrt_price, sa, sb);
        value.amount0 = amounts.amount0;
        value.amount1 = amounts.amount1;
    } else {
        value.placement = RangePlacement::AbovePrice;
        value.amount0 = l * (sb - sa) / (sa * sb);
    }
    return value;
}

PortfolioValue value_positions(std::vector<Position> positions, int32_t current_tick,
                               double current_sqrt_price) {
    std::sort(positions.begin(), positions.end());

    PortfolioValue portfolio;
    portfolio.positions.reserve(positions.size());

    for (const auto& position : positions) {
        PositionValue value = value_position(position, current_tick, current_sqrt_price);
        portfolio.total0 += value.amount0;
        portfolio.total1 += value.amount1;
        if (value.is_active()) {
            portfolio.active_liquidity += position.liquidity;
            ++portfolio.active_count;
        }
        portfolio.positions.push_back(std::move(value));
    }
    return portfolio;
}

} // namespace clamm
