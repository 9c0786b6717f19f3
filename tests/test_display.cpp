// clamm - Report Formatting Tests

#include <catch2/catch.hpp>
#include <clamm/analytics.hpp>
#include <clamm/display.hpp>
#include <clamm/tick_math.hpp>

#include <sstream>

using namespace clamm;
using namespace clamm::display;
using Catch::Detail::Approx;

namespace {

const std::vector<std::string> STABLECOINS = {"USDC", "DAI", "USDT"};

PoolSnapshot test_pool() {
    PoolSnapshot pool;
    pool.tick = 5;
    pool.liquidity = 150;
    pool.fee_tier = 500;
    pool.token0 = {"AAA", 0};
    pool.token1 = {"BBB", 0};
    return pool;
}

Distribution test_distribution(const PoolSnapshot& pool) {
    TickDeltaMap deltas;
    deltas[-20] = 100;
    deltas[0] = 50;
    deltas[30] = -100;
    deltas[50] = -50;
    return aggregate_range_distribution(deltas, pool.tick, pool.tick_spacing(),
                                        pool.sqrt_price() * pool.sqrt_price());
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST_CASE("Price orientation", "[display]") {
    SECTION("Stablecoin token0 against a volatile token1") {
        REQUIRE(should_invert_price("USDC", "WETH", 3.0e-4, STABLECOINS));
        REQUIRE(should_invert_price("USDC", "WETH", 5.0, STABLECOINS));
    }

    SECTION("Volatile token0 priced in a stablecoin") {
        REQUIRE_FALSE(should_invert_price("WETH", "USDC", 3000.0, STABLECOINS));
    }

    SECTION("No stablecoin: invert prices below one") {
        REQUIRE_FALSE(should_invert_price("WBTC", "WETH", 20.0, STABLECOINS));
        REQUIRE(should_invert_price("WETH", "WBTC", 0.05, STABLECOINS));
    }

    SECTION("Two stablecoins") {
        REQUIRE_FALSE(should_invert_price("USDC", "DAI", 1.0001, STABLECOINS));
        REQUIRE(should_invert_price("USDC", "DAI", 0.9999, STABLECOINS));
    }

    SECTION("View label and orientation") {
        PoolSnapshot pool = test_pool();
        pool.token0 = {"USDC", 6};
        pool.token1 = {"WETH", 18};
        PriceView view = PriceView::for_pool(pool, STABLECOINS);
        REQUIRE(view.invert);
        REQUIRE(view.label() == "USDC for WETH");
        REQUIRE(view.orient(4.0) == Approx(0.25));
        REQUIRE(view.price_at(0) == Approx(1e12));
    }
}

TEST_CASE("Formatting helpers", "[display]") {
    REQUIRE(to_display_amount(1.5e6, 6) == Approx(1.5));
    REQUIRE(to_display_amount(42.0, 0) == Approx(42.0));
    REQUIRE(format_fixed(3.14159, 2) == "3.14");
    REQUIRE(format_fixed(2.5, 0).size() == 1);
    REQUIRE(format_fixed(-0.1234567, 6) == "-0.123457");
    REQUIRE(format_date(1700000000) == "Nov 14, 2023");
    REQUIRE(format_date(0) == "Jan 01, 1970");
}

TEST_CASE("Distribution report", "[display]") {
    PoolSnapshot pool = test_pool();
    Distribution dist = test_distribution(pool);
    PriceView view = PriceView::for_pool(pool, STABLECOINS);

    SECTION("Empty ranges hidden by default") {
        std::ostringstream out;
        write_distribution(out, dist, pool, view, false);
        std::string text = out.str();
        REQUIRE(contains(text, "ticks=[-20, -10]"));
        REQUIRE(contains(text, "Current tick, both assets present!"));
        REQUIRE(contains(text, "remaining in the current tick range"));
        REQUIRE(contains(text, "locked, potentially worth"));
        REQUIRE(contains(text, "In total: "));
        REQUIRE_FALSE(contains(text, "ticks=[50, 60]"));
    }

    SECTION("Empty ranges shown on request") {
        std::ostringstream out;
        write_distribution(out, dist, pool, view, true);
        REQUIRE(contains(out.str(), "ticks=[50, 60]"));
    }
}

TEST_CASE("Position reports", "[display]") {
    PoolSnapshot pool = test_pool();
    Position active;
    active.id = "42";
    active.tick_lower = 0;
    active.tick_upper = 50;
    active.liquidity = 150;
    Position inactive;
    inactive.id = "43";
    inactive.tick_lower = 60;
    inactive.tick_upper = 80;
    inactive.liquidity = 10;

    SECTION("Portfolio") {
        PortfolioValue portfolio = value_positions({active, inactive}, pool.tick, pool.sqrt_price());
        std::ostringstream out;
        write_positions(out, portfolio, pool);
        std::string text = out.str();
        REQUIRE(contains(text, "at tick 5"));
        REQUIRE(contains(text, "in range [0,50]"));
        REQUIRE_FALSE(contains(text, "in range [60,80]"));
        REQUIRE(contains(text, "In total (including inactive positions)"));
        REQUIRE(contains(text, "from pool: 150 (equal)"));
    }

    SECTION("Single position") {
        std::ostringstream out;
        write_position(out, value_position(inactive, pool.tick, pool.sqrt_price()), pool);
        REQUIRE(contains(out.str(), "in range [60,80]"));
        REQUIRE(contains(out.str(), "0.00 BBB"));
    }
}

TEST_CASE("Pool reports", "[display]") {
    PoolSnapshot pool = test_pool();

    SECTION("Current range") {
        TokenAmounts amounts = current_range_amounts(pool.liquidity, pool.tick,
                                                     pool.tick_spacing(), pool.sqrt_price());
        std::ostringstream out;
        write_current_range(out, pool, amounts);
        REQUIRE(contains(out.str(), "L=150"));
        REQUIRE(contains(out.str(), "BBB for 1 AAA"));
        REQUIRE(contains(out.str(), "Amounts at the current tick range: "));
    }

    SECTION("Volatility") {
        std::vector<VolatilityPoint> series = {{1700000000, 1e6, 0.011462983904725681}};
        std::ostringstream out;
        write_volatility(out, 1e8, "USDC", series);
        REQUIRE(contains(out.str(), "100000000 USDC locked"));
        REQUIRE(contains(out.str(), "Nov 14, 2023: volume=1000000 IV=1.15%"));
    }

    SECTION("Bound check") {
        bound_solver::BoundCheck ok;
        ok.from_liquidity = 19.027;
        ok.from_amounts = 19.0295;
        ok.relative_error = 1.3e-4;
        ok.within_tolerance = true;

        std::ostringstream out;
        write_bound_check(out, "a", 19.027, ok);
        REQUIRE(contains(out.str(), "a: 19.03 vs 19.03 (via liquidity)"));
        REQUIRE_FALSE(contains(out.str(), "[out of tolerance]"));

        ok.within_tolerance = false;
        std::ostringstream flagged;
        write_bound_check(flagged, "a", 19.027, ok);
        REQUIRE(contains(flagged.str(), "[out of tolerance]"));
    }
}
