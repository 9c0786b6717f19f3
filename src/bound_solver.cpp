// =============================================================================
// bound_solver.cpp - Price bound recovery from amounts and liquidity
// =============================================================================

#include "clamm/bound_solver.hpp"

#include <cmath>
#include <string>

namespace clamm {
namespace bound_solver {

namespace {

// Reject denominators that would turn the result into inf or NaN
void require_nonzero(double value, const char* what) {
    if (value == 0.0 || !std::isfinite(value)) {
        throw DomainError(std::string("Non-invertible input: ") + what);
    }
}

BoundCheck make_check(double from_liquidity, double from_amounts, double tolerance) {
    BoundCheck check;
    check.from_liquidity = from_liquidity;
    check.from_amounts = from_amounts;
    check.relative_error = relative_error(from_liquidity, from_amounts);
    check.within_tolerance = check.relative_error <= tolerance;
    return check;
}

} // namespace

double lower_bound_from_liquidity(double liquidity, double sp, double y) {
    require_nonzero(liquidity, "liquidity is zero");
    double sa = sp - y / liquidity;
    return sa * sa;
}

double lower_bound_from_amounts(double sp, double sb, double x, double y) {
    require_nonzero(x, "token0 amount is zero");
    require_nonzero(sp, "current sqrt price is zero");
    require_nonzero(sb, "upper sqrt price is zero");
    double sa = y / (sb * x) + sp - y / (sp * x);
    return sa * sa;
}

double upper_bound_from_liquidity(double liquidity, double sp, double x) {
    require_nonzero(liquidity - sp * x, "liquidity equals sqrt(P) * x");
    double sb = (liquidity * sp) / (liquidity - sp * x);
    return sb * sb;
}

double upper_bound_from_amounts(double sp, double sa, double x, double y) {
    double price = sp * sp;
    double denominator = (sa * sp - price) * x + y;
    require_nonzero(denominator, "amount ratio has no upper bound");
    double sb = sp * y / denominator;
    return sb * sb;
}

double upper_ratio(double price, double d, double x, double y) {
    double denominator = (d - 1.0) * price * x + y;
    require_nonzero(denominator, "ratio denominator is zero");
    return y / denominator;
}

double lower_ratio(double price, double c, double x, double y) {
    double denominator = c * price * x;
    require_nonzero(denominator, "ratio denominator is zero");
    return 1.0 + y * (1.0 - c) / denominator;
}

PriceRange bounds_from_ratios(double price, double c, double d) noexcept {
    return {d * d * price, c * c * price};
}

BoundCheck check_lower_bound(double x, double y, double sp, double sb,
                             double liquidity, double tolerance) {
    return make_check(lower_bound_from_liquidity(liquidity, sp, y),
                      lower_bound_from_amounts(sp, sb, x, y),
                      tolerance);
}

BoundCheck check_upper_bound(double x, double y, double sp, double sa,
                             double liquidity, double tolerance) {
    return make_check(upper_bound_from_liquidity(liquidity, sp, x),
                      upper_bound_from_amounts(sp, sa, x, y),
                      tolerance);
}

double relative_error(double actual, double expected) {
    require_nonzero(expected, "expected value is zero");
    return std::abs(actual - expected) / std::abs(expected);
}

} // namespace bound_solver
} // namespace clamm
