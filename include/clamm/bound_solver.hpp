#ifndef CLAMM_BOUND_SOLVER_HPP
#define CLAMM_BOUND_SOLVER_HPP

#include "types.hpp"

namespace clamm {

// =============================================================================
// Inverse Bound Solver
// =============================================================================
//
// Recovers a missing range bound from amounts held at the current price.
// Each bound has two independent derivations: one through a known liquidity
// value, one straight from the amount ratio. Results are prices (squared
// sqrt values). They approximate on-chain state, which is discretized into
// integer liquidity and ticks, so callers compare them within a tolerance.
//
// Singular inputs (zero liquidity, zero amounts, vanishing denominators)
// throw DomainError.

namespace bound_solver {

// Relative tolerance for cross-checking the two derivations
constexpr double DEFAULT_TOLERANCE = 0.01;

// Pa = (sqrt(P) - y / L)^2
double lower_bound_from_liquidity(double liquidity, double sp, double y);

// Pa = (y / (sqrt(Pb) x) + sqrt(P) - y / (sqrt(P) x))^2
double lower_bound_from_amounts(double sp, double sb, double x, double y);

// Pb = (L sqrt(P) / (L - sqrt(P) x))^2
double upper_bound_from_liquidity(double liquidity, double sp, double x);

// Pb = (sqrt(P) y / ((sqrt(Pa) sqrt(P) - P) x + y))^2
double upper_bound_from_amounts(double sp, double sa, double x, double y);

// Bounds as ratios of the current sqrt price: c = sqrt(Pb) / sqrt(P),
// d = sqrt(Pa) / sqrt(P). price is P itself, not its square root.
double upper_ratio(double price, double d, double x, double y);
double lower_ratio(double price, double c, double x, double y);

// Absolute bounds from ratios: [d^2 P, c^2 P]
PriceRange bounds_from_ratios(double price, double c, double d) noexcept;

// Outcome of evaluating both derivations of one bound
struct BoundCheck {
    double from_liquidity = 0.0;
    double from_amounts = 0.0;
    double relative_error = 0.0;    // |a - b| / |b|, b = from_amounts
    bool within_tolerance = false;
};

BoundCheck check_lower_bound(double x, double y, double sp, double sb,
                             double liquidity,
                             double tolerance = DEFAULT_TOLERANCE);

BoundCheck check_upper_bound(double x, double y, double sp, double sa,
                             double liquidity,
                             double tolerance = DEFAULT_TOLERANCE);

// |actual - expected| / |expected|
double relative_error(double actual, double expected);

} // namespace bound_solver

} // namespace clamm

#endif // CLAMM_BOUND_SOLVER_HPP
