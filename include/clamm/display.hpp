#ifndef CLAMM_DISPLAY_HPP
#define CLAMM_DISPLAY_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "analytics.hpp"
#include "bound_solver.hpp"
#include "distribution.hpp"
#include "position.hpp"
#include "records.hpp"

namespace clamm {
namespace display {

// =============================================================================
// Formatting Helpers
// =============================================================================

// Quote prices in the stablecoin when token0 is one and token1 is not;
// otherwise invert whenever the adjusted price is below 1.
bool should_invert_price(const std::string& symbol0, const std::string& symbol1,
                         double adjusted_price,
                         const std::vector<std::string>& stablecoins);

// Raw base units -> whole tokens
double to_display_amount(double raw, int decimals) noexcept;

std::string format_fixed(double value, int precision);

// "Mar 04, 2024" (UTC)
std::string format_date(int64_t unix_seconds);

// =============================================================================
// Price Orientation
// =============================================================================

struct PriceView {
    TokenInfo token0;
    TokenInfo token1;
    bool invert = false;

    static PriceView for_pool(const PoolSnapshot& pool,
                              const std::vector<std::string>& stablecoins);

    // Adjusted price at tick, oriented for display
    double price_at(int32_t tick) const;
    double orient(double adjusted_price) const;

    // "USDC for WETH" when inverted, "WETH for USDC" otherwise
    std::string label() const;
};

// =============================================================================
// Reports
// =============================================================================

void write_distribution(std::ostream& out, const Distribution& dist,
                        const PoolSnapshot& pool, const PriceView& view,
                        bool show_empty_ranges);

void write_positions(std::ostream& out, const PortfolioValue& portfolio,
                     const PoolSnapshot& pool);

void write_position(std::ostream& out, const PositionValue& value,
                    const PoolSnapshot& pool);

void write_current_range(std::ostream& out, const PoolSnapshot& pool,
                         const TokenAmounts& amounts);

void write_volatility(std::ostream& out, double locked_value, const std::string& unit,
                      const std::vector<VolatilityPoint>& series);

void write_bound_check(std::ostream& out, const std::string& name, double expected,
                       const bound_solver::BoundCheck& check);

} // namespace display
} // namespace clamm

#endif // CLAMM_DISPLAY_HPP
