// clamm - Range Distribution Tests

#include <catch2/catch.hpp>
#include "wide_int_string_maker.hpp"
#include <clamm/distribution.hpp>
#include <clamm/position.hpp>
#include <clamm/tick_math.hpp>

#include <cstring>

using namespace clamm;
using Catch::Detail::Approx;

namespace {

// Two positions: [-20, 30) with L = 100 and [0, 50) with L = 50
TickDeltaMap two_position_deltas() {
    TickDeltaMap deltas;
    deltas[-20] = 100;
    deltas[0] = 50;
    deltas[30] = -100;
    deltas[50] = -50;
    return deltas;
}

constexpr int32_t SPACING = 10;
constexpr int32_t CURRENT_TICK = 5;

} // namespace

TEST_CASE("Range placement names", "[distribution]") {
    REQUIRE(std::strcmp(to_string(RangePlacement::BelowPrice), "below_price") == 0);
    REQUIRE(std::strcmp(to_string(RangePlacement::Current), "current") == 0);
    REQUIRE(std::strcmp(to_string(RangePlacement::AbovePrice), "above_price") == 0);
}

TEST_CASE("Single range amounts", "[distribution]") {
    double sp = tick_math::tick_to_sqrt_price(CURRENT_TICK);

    SECTION("Below the current range: token1 locked") {
        RangeAmounts r = range_amounts(-20, SPACING, 100, 0, sp);
        double sa = tick_math::tick_to_sqrt_price(-20);
        double sb = tick_math::tick_to_sqrt_price(-10);
        REQUIRE(r.placement == RangePlacement::BelowPrice);
        REQUIRE(r.tick_upper == -10);
        REQUIRE(r.locked0 == 0.0);
        REQUIRE(r.locked1 == Approx(100 * (sb - sa)));
        REQUIRE(r.potential0 == Approx(r.locked1 / (sa * sb)));
        REQUIRE(r.potential1 == 0.0);
    }

    SECTION("Current range splits at the current price") {
        RangeAmounts r = range_amounts(0, SPACING, 150, 0, sp);
        double sa = tick_math::tick_to_sqrt_price(0);
        double sb = tick_math::tick_to_sqrt_price(10);
        REQUIRE(r.placement == RangePlacement::Current);
        REQUIRE(r.locked0 == Approx(150 * (sb - sp) / (sp * sb)));
        REQUIRE(r.locked1 == Approx(150 * (sp - sa)));
        REQUIRE(r.potential0 == 0.0);
        REQUIRE(r.potential1 == 0.0);
    }

    SECTION("Above the current range: token0 locked") {
        RangeAmounts r = range_amounts(30, SPACING, 50, 0, sp);
        double sa = tick_math::tick_to_sqrt_price(30);
        double sb = tick_math::tick_to_sqrt_price(40);
        REQUIRE(r.placement == RangePlacement::AbovePrice);
        REQUIRE(r.locked1 == 0.0);
        REQUIRE(r.potential1 == Approx(50 * (sb - sa)));
        REQUIRE(r.locked0 == Approx(r.potential1 / (sa * sb)));
    }
}

TEST_CASE("Aggregate distribution from zero", "[distribution]") {
    double price = tick_math::tick_to_price(CURRENT_TICK);
    Distribution dist = aggregate_range_distribution(two_position_deltas(), CURRENT_TICK,
                                                     SPACING, price);

    SECTION("Ranges cover the populated domain in order") {
        REQUIRE(dist.range_count() == 8);
        REQUIRE(dist.ranges.front().tick_lower == -20);
        REQUIRE(dist.ranges.back().tick_lower == 50);
        for (size_t i = 1; i < dist.ranges.size(); ++i) {
            REQUIRE(dist.ranges[i].tick_lower == dist.ranges[i - 1].tick_lower + SPACING);
        }
    }

    SECTION("Accumulated liquidity per range") {
        const I128 expected[] = {100, 100, 150, 150, 150, 50, 50, 0};
        for (size_t i = 0; i < dist.ranges.size(); ++i) {
            REQUIRE(dist.ranges[i].liquidity == expected[i]);
        }
        REQUIRE(dist.current_range_lower == 0);
        REQUIRE(dist.current_liquidity == 150);
        REQUIRE_FALSE(dist.ranges.back().has_liquidity());
    }

    SECTION("Placement relative to the current range") {
        REQUIRE(dist.ranges[0].placement == RangePlacement::BelowPrice);
        REQUIRE(dist.ranges[1].placement == RangePlacement::BelowPrice);
        REQUIRE(dist.ranges[2].placement == RangePlacement::Current);
        REQUIRE(dist.ranges[3].placement == RangePlacement::AbovePrice);

        const RangeAmounts* current = dist.current_range();
        REQUIRE(current != nullptr);
        REQUIRE(current->tick_lower == 0);
    }

    SECTION("Totals add locked amounts only") {
        double total0 = 0.0;
        double total1 = 0.0;
        for (const auto& r : dist.ranges) {
            total0 += r.locked0;
            total1 += r.locked1;
        }
        REQUIRE(dist.total0 == Approx(total0));
        REQUIRE(dist.total1 == Approx(total1));
    }

    SECTION("Totals equal the value of the underlying positions") {
        std::vector<Position> positions = {
            {"1", -20, 30, 100},
            {"2", 0, 50, 50},
        };
        PortfolioValue portfolio = value_positions(positions, CURRENT_TICK,
                                                   tick_math::tick_to_sqrt_price(CURRENT_TICK));
        REQUIRE(dist.total0 == Approx(portfolio.total0));
        REQUIRE(dist.total1 == Approx(portfolio.total1));
    }
}

TEST_CASE("Aggregate distribution edge cases", "[distribution]") {
    double price = tick_math::tick_to_price(CURRENT_TICK);

    SECTION("Empty map") {
        Distribution dist = aggregate_range_distribution({}, CURRENT_TICK, SPACING, price);
        REQUIRE(dist.range_count() == 0);
        REQUIRE(dist.total0 == 0.0);
        REQUIRE(dist.total1 == 0.0);
        REQUIRE(dist.current_range() == nullptr);
    }

    SECTION("Current range above the populated domain") {
        TickDeltaMap deltas;
        deltas[-20] = 100;
        deltas[-10] = -100;
        Distribution dist = aggregate_range_distribution(deltas, CURRENT_TICK, SPACING, price);
        REQUIRE(dist.range_count() == 2);
        REQUIRE(dist.current_range() == nullptr);
        REQUIRE(dist.current_liquidity == 0);
        REQUIRE(dist.ranges[0].placement == RangePlacement::BelowPrice);
        REQUIRE(dist.total0 == 0.0);
        REQUIRE(dist.total1 > 0.0);
    }

    SECTION("Negative current tick") {
        Distribution dist = aggregate_range_distribution(two_position_deltas(), -5, SPACING,
                                                         tick_math::tick_to_price(-5));
        REQUIRE(dist.current_range_lower == -10);
        REQUIRE(dist.current_liquidity == 100);
        REQUIRE(dist.current_range()->placement == RangePlacement::Current);
    }

    SECTION("Current tick on a range boundary belongs to the range above") {
        Distribution dist = aggregate_range_distribution(two_position_deltas(), 0, SPACING, 1.0);
        REQUIRE(dist.current_range_lower == 0);
        REQUIRE(dist.current_liquidity == 150);
        // At the lower boundary the current range holds token0 only
        REQUIRE(dist.current_range()->locked1 == Approx(0.0).margin(1e-12));
    }

    SECTION("Off-grid ticks fold into their range") {
        TickDeltaMap deltas;
        deltas[-15] = 100;
        deltas[25] = -100;
        Distribution dist = aggregate_range_distribution(deltas, CURRENT_TICK, SPACING, price);
        REQUIRE(dist.ranges.front().tick_lower == -20);
        REQUIRE(dist.ranges.back().tick_lower == 20);
        REQUIRE(dist.range_count() == 5);
        REQUIRE(dist.ranges[3].liquidity == 100);
        REQUIRE(dist.ranges[4].liquidity == 0);
    }

    SECTION("Invalid inputs") {
        REQUIRE_THROWS_AS(aggregate_range_distribution(two_position_deltas(), CURRENT_TICK,
                                                       0, price), DomainError);
        REQUIRE_THROWS_AS(aggregate_range_distribution(two_position_deltas(), CURRENT_TICK,
                                                       SPACING, 0.0), DomainError);
        REQUIRE_THROWS_AS(aggregate_range_distribution(two_position_deltas(), CURRENT_TICK,
                                                       SPACING, -1.0), DomainError);
    }

    SECTION("Ticks outside the valid range") {
        TickDeltaMap wide_deltas;
        wide_deltas[-2000000000] = 1;
        wide_deltas[2000000000] = -1;
        REQUIRE_THROWS_AS(aggregate_range_distribution(wide_deltas, 0, 60, 1.0), DomainError);

        TickDeltaMap high;
        high[tick_math::MAX_TICK + 1] = 1;
        REQUIRE_THROWS_AS(aggregate_range_distribution(high, 0, 60, 1.0), DomainError);

        REQUIRE_THROWS_AS(aggregate_range_distribution(two_position_deltas(),
                                                       tick_math::MIN_TICK - 1, SPACING, price),
                          DomainError);
        REQUIRE_THROWS_AS(aggregate_range_distribution(two_position_deltas(), CURRENT_TICK,
                                                       2000000000, price), DomainError);
    }

    SECTION("Ticks at the ends of the valid range") {
        TickDeltaMap deltas;
        deltas[tick_math::MIN_TICK] = 5;
        deltas[tick_math::MAX_TICK] = -5;
        Distribution dist = aggregate_range_distribution(deltas, 0, 200000, 1.0);
        REQUIRE(dist.ranges.front().tick_lower <= tick_math::MIN_TICK);
        REQUIRE(dist.ranges.back().tick_lower <= tick_math::MAX_TICK);
        REQUIRE(dist.current_liquidity == 5);
    }
}

TEST_CASE("Anchored distribution", "[distribution]") {
    double price = tick_math::tick_to_price(CURRENT_TICK);

    SECTION("Complete map matches the zero-start sweep") {
        Distribution zero = aggregate_range_distribution(two_position_deltas(), CURRENT_TICK,
                                                         SPACING, price);
        Distribution anchored = aggregate_range_distribution_anchored(
            two_position_deltas(), CURRENT_TICK, SPACING, price, 150);

        REQUIRE(anchored.range_count() == zero.range_count());
        for (size_t i = 0; i < zero.ranges.size(); ++i) {
            REQUIRE(anchored.ranges[i].tick_lower == zero.ranges[i].tick_lower);
            REQUIRE(anchored.ranges[i].liquidity == zero.ranges[i].liquidity);
        }
        REQUIRE(anchored.total0 == Approx(zero.total0));
        REQUIRE(anchored.total1 == Approx(zero.total1));
    }

    SECTION("Truncated map keeps absolute liquidity") {
        // The tick at -20 is missing, as when a query is cut short
        TickDeltaMap deltas = two_position_deltas();
        deltas.erase(-20);

        Distribution zero = aggregate_range_distribution(deltas, CURRENT_TICK, SPACING, price);
        REQUIRE(zero.current_liquidity == 50);

        Distribution anchored = aggregate_range_distribution_anchored(
            deltas, CURRENT_TICK, SPACING, price, 150);
        REQUIRE(anchored.current_liquidity == 150);
        const I128 expected[] = {150, 150, 150, 50, 50, 0};
        REQUIRE(anchored.range_count() == 6);
        for (size_t i = 0; i < anchored.ranges.size(); ++i) {
            REQUIRE(anchored.ranges[i].liquidity == expected[i]);
        }
    }

    SECTION("Domain widens to the current range") {
        TickDeltaMap deltas;
        deltas[100] = 40;
        deltas[120] = -40;
        Distribution dist = aggregate_range_distribution_anchored(deltas, CURRENT_TICK,
                                                                  SPACING, price, 0);
        REQUIRE(dist.ranges.front().tick_lower == 0);
        REQUIRE(dist.ranges.back().tick_lower == 120);
        REQUIRE(dist.current_range() != nullptr);
        REQUIRE(dist.ranges[10].liquidity == 40);
        REQUIRE(dist.ranges[11].liquidity == 40);
        REQUIRE(dist.ranges[12].liquidity == 0);
    }

    SECTION("Walking down removes deltas crossed") {
        TickDeltaMap deltas;
        deltas[-30] = 70;
        deltas[40] = -70;
        Distribution dist = aggregate_range_distribution_anchored(deltas, CURRENT_TICK,
                                                                  SPACING, price, 70);
        REQUIRE(dist.ranges.front().tick_lower == -30);
        REQUIRE(dist.ranges.front().liquidity == 70);
        REQUIRE(dist.ranges.back().tick_lower == 40);
        REQUIRE(dist.ranges.back().liquidity == 0);
    }

    SECTION("Empty map yields the current range alone") {
        Distribution dist = aggregate_range_distribution_anchored({}, CURRENT_TICK, SPACING,
                                                                  price, 1000);
        REQUIRE(dist.range_count() == 1);
        REQUIRE(dist.ranges[0].liquidity == 1000);
        REQUIRE(dist.ranges[0].placement == RangePlacement::Current);
    }

    SECTION("Ticks outside the valid range") {
        TickDeltaMap deltas;
        deltas[-2000000000] = 1;
        REQUIRE_THROWS_AS(aggregate_range_distribution_anchored(deltas, CURRENT_TICK, SPACING,
                                                                price, 1), DomainError);
        REQUIRE_THROWS_AS(aggregate_range_distribution_anchored({}, tick_math::MAX_TICK + 1,
                                                                SPACING, price, 1),
                          DomainError);
    }
}
