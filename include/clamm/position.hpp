#ifndef CLAMM_POSITION_HPP
#define CLAMM_POSITION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "distribution.hpp"
#include "types.hpp"
#include "wide_int.hpp"

namespace clamm {

// =============================================================================
// Position
// =============================================================================

struct Position {
    std::string id;
    int32_t tick_lower = 0;
    int32_t tick_upper = 0;
    U128 liquidity = 0;

    bool operator<(const Position& other) const {
        if (tick_lower != other.tick_lower) return tick_lower < other.tick_lower;
        if (tick_upper != other.tick_upper) return tick_upper < other.tick_upper;
        if (liquidity != other.liquidity) return liquidity < other.liquidity;
        return id < other.id;
    }
};

struct PositionValue {
    Position position;
    RangePlacement placement;
    double amount0;
    double amount1;

    bool is_active() const { return placement == RangePlacement::Current; }
};

// Value a position at the current price. The position is active when
// tick_lower <= current_tick < tick_upper; current_sqrt_price splits its
// amounts. Throws DomainError when tick_lower >= tick_upper.
PositionValue value_position(const Position& position, int32_t current_tick,
                             double current_sqrt_price);

// =============================================================================
// Portfolio
// =============================================================================

struct PortfolioValue {
    std::vector<PositionValue> positions;   // Sorted by (lower, upper, liquidity, id)
    double total0 = 0.0;
    double total1 = 0.0;
    U128 active_liquidity = 0;               // Exact sum over active positions
    size_t active_count = 0;

    // Active positions account for all of the pool's in-range liquidity
    bool matches_pool(U128 pool_liquidity) const {
        return active_liquidity == pool_liquidity;
    }
};

PortfolioValue value_positions(std::vector<Position> positions, int32_t current_tick,
                               double current_sqrt_price);

} // namespace clamm

#endif // CLAMM_POSITION_HPP
