// =============================================================================
// display.cpp - Human-readable reports
// =============================================================================

#include "clamm/display.hpp"
#include "clamm/tick_math.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clamm {
namespace display {

namespace {

bool is_stablecoin(const std::string& symbol, const std::vector<std::string>& stablecoins) {
    return std::find(stablecoins.begin(), stablecoins.end(), symbol) != stablecoins.end();
}

std::string amount_text(double raw, const TokenInfo& token) {
    return format_fixed(to_display_amount(raw, token.decimals), 2) + " " + token.symbol;
}

void write_current_price_line(std::ostream& out, const PoolSnapshot& pool) {
    out << "Current price=" << format_fixed(pool.adjusted_price(), 6) << " "
        << pool.token1.symbol << " for " << pool.token0.symbol
        << " at tick " << pool.tick << "\n";
}

void write_position_line(std::ostream& out, const PositionValue& value,
                         const PoolSnapshot& pool) {
    out << "  position " << std::setw(7) << value.position.id
        << " in range [" << value.position.tick_lower << "," << value.position.tick_upper
        << "]: " << amount_text(value.amount0, pool.token0)
        << " and " << amount_text(value.amount1, pool.token1)
        << " at the current price\n";
}

} // namespace

// =============================================================================
// Formatting Helpers
// =============================================================================

bool should_invert_price(const std::string& symbol0, const std::string& symbol1,
                         double adjusted_price,
                         const std::vector<std::string>& stablecoins) {
    if (is_stablecoin(symbol0, stablecoins) && !is_stablecoin(symbol1, stablecoins)) {
        return true;
    }
    return adjusted_price < 1.0;
}

double to_display_amount(double raw, int decimals) noexcept {
    return raw / std::pow(10.0, decimals);
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_date(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%b %d, %Y");
    return oss.str();
}

// =============================================================================
// Price Orientation
// =============================================================================

PriceView PriceView::for_pool(const PoolSnapshot& pool,
                              const std::vector<std::string>& stablecoins) {
    PriceView view;
    view.token0 = pool.token0;
    view.token1 = pool.token1;
    view.invert = should_invert_price(pool.token0.symbol, pool.token1.symbol,
                                      pool.adjusted_price(), stablecoins);
    return view;
}

double PriceView::price_at(int32_t tick) const {
    return orient(tick_math::adjust_price_for_decimals(
        tick_math::tick_to_price(tick), token0.decimals, token1.decimals));
}

double PriceView::orient(double adjusted_price) const {
    return invert ? 1.0 / adjusted_price : adjusted_price;
}

std::string PriceView::label() const {
    if (invert) {
        return token0.symbol + " for " + token1.symbol;
    }
    return token1.symbol + " for " + token0.symbol;
}

// =============================================================================
// Reports
// =============================================================================

void write_distribution(std::ostream& out, const Distribution& dist,
                        const PoolSnapshot& pool, const PriceView& view,
                        bool show_empty_ranges) {
    for (const auto& range : dist.ranges) {
        bool is_current = range.placement == RangePlacement::Current;
        if (!is_current && !range.has_liquidity() && !show_empty_ranges) {
            continue;
        }

        out << "ticks=[" << range.tick_lower << ", " << range.tick_upper
            << "], bottom tick price=" << format_fixed(view.price_at(range.tick_lower), 6)
            << " " << view.label() << "\n";

        switch (range.placement) {
            case RangePlacement::BelowPrice:
                out << "        " << amount_text(range.locked1, pool.token1)
                    << " locked, potentially worth "
                    << amount_text(range.potential0, pool.token0) << "\n";
                break;
            case RangePlacement::Current:
                out << "        Current tick, both assets present!\n";
                out << "        Current price="
                    << format_fixed(view.orient(pool.adjusted_price()), 6)
                    << " " << view.label() << "\n";
                out << "        " << amount_text(range.locked0, pool.token0)
                    << " and " << amount_text(range.locked1, pool.token1)
                    << " remaining in the current tick range\n";
                break;
            case RangePlacement::AbovePrice:
                out << "        " << amount_text(range.locked0, pool.token0)
                    << " locked, potentially worth "
                    << amount_text(range.potential1, pool.token1) << "\n";
                break;
        }
    }

    out << "In total: " << amount_text(dist.total0, pool.token0)
        << " and " << amount_text(dist.total1, pool.token1) << "\n";
}

void write_positions(std::ostream& out, const PortfolioValue& portfolio,
                     const PoolSnapshot& pool) {
    write_current_price_line(out, pool);

    for (const auto& value : portfolio.positions) {
        if (value.is_active()) {
            write_position_line(out, value, pool);
        }
    }

    out << "In total (including inactive positions): "
        << amount_text(portfolio.total0, pool.token0) << " and "
        << amount_text(portfolio.total1, pool.token1) << "\n";
    out << "Total liquidity from " << portfolio.active_count << " active positions: "
        << wide::to_string(portfolio.active_liquidity)
        << ", from pool: " << wide::to_string(pool.liquidity)
        << (portfolio.matches_pool(pool.liquidity) ? " (equal)" : " (differ)") << "\n";
}

void write_position(std::ostream& out, const PositionValue& value,
                    const PoolSnapshot& pool) {
    write_current_price_line(out, pool);
    write_position_line(out, value, pool);
}

void write_current_range(std::ostream& out, const PoolSnapshot& pool,
                         const TokenAmounts& amounts) {
    double price = pool.adjusted_price();
    out << "L=" << wide::to_string(pool.liquidity) << "\n";
    out << "tick=" << pool.tick << "\n";
    out << "Current price: " << format_fixed(price, 6) << " " << pool.token1.symbol
        << " for 1 " << pool.token0.symbol << " (" << format_fixed(1.0 / price, 6)
        << " " << pool.token0.symbol << " for 1 " << pool.token1.symbol << ")\n";
    out << "Amounts at the current tick range: " << amount_text(amounts.amount0, pool.token0)
        << " and " << amount_text(amounts.amount1, pool.token1) << "\n";
}

void write_volatility(std::ostream& out, double locked_value, const std::string& unit,
                      const std::vector<VolatilityPoint>& series) {
    out << format_fixed(locked_value, 0) << " " << unit << " locked\n";
    for (const auto& point : series) {
        out << format_date(point.date) << ": volume=" << format_fixed(point.volume, 0)
            << " IV=" << format_fixed(point.implied_volatility * 100.0, 2) << "%\n";
    }
}

void write_bound_check(std::ostream& out, const std::string& name, double expected,
                       const bound_solver::BoundCheck& check) {
    out << name << ": " << format_fixed(expected, 2)
        << " vs " << format_fixed(check.from_liquidity, 2) << " (via liquidity), "
        << format_fixed(check.from_amounts, 2) << " (via amounts), error "
        << format_fixed(check.relative_error * 100.0, 6) << "%";
    if (!check.within_tolerance) {
        out << " [out of tolerance]";
    }
    out << "\n";
}

} // namespace display
} // namespace clamm
