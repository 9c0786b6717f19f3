// =============================================================================
// liquidity_math.cpp - Liquidity <-> token amount conversion
// =============================================================================

#include "clamm/liquidity_math.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace clamm {
namespace liquidity_math {

namespace {

void order_bounds(double& sa, double& sb) {
    if (sa > sb) {
        std::swap(sa, sb);
    }
    if (sb == sa) {
        throw DomainError("Degenerate range: lower and upper sqrt prices are equal");
    }
    if (!(sa > 0.0)) {
        throw DomainError("Sqrt price bounds must be positive");
    }
}

double clamp_price(double sp, double sa, double sb) {
    return std::max(std::min(sp, sb), sa);
}

} // namespace

double liquidity_for_amount0(double x, double sa, double sb) {
    order_bounds(sa, sb);
    return x * sa * sb / (sb - sa);
}

double liquidity_for_amount1(double y, double sa, double sb) {
    order_bounds(sa, sb);
    return y / (sb - sa);
}

double liquidity_for_amounts(double x, double y, double sp, double sa, double sb) {
    order_bounds(sa, sb);

    if (sp <= sa) {
        // Below range: all token0
        return liquidity_for_amount0(x, sa, sb);
    } else if (sp < sb) {
        // In range: use both
        double liquidity0 = liquidity_for_amount0(x, sp, sb);
        double liquidity1 = liquidity_for_amount1(y, sa, sp);
        return std::min(liquidity0, liquidity1);
    }
    // Above range: all token1
    return liquidity_for_amount1(y, sa, sb);
}

double amount0_for_liquidity(double liquidity, double sp, double sa, double sb) {
    order_bounds(sa, sb);
    sp = clamp_price(sp, sa, sb);
    return liquidity * (sb - sp) / (sp * sb);
}

double amount1_for_liquidity(double liquidity, double sp, double sa, double sb) {
    order_bounds(sa, sb);
    sp = clamp_price(sp, sa, sb);
    return liquidity * (sp - sa);
}

TokenAmounts amounts_for_liquidity(double liquidity, double sp, double sa, double sb) {
    return {amount0_for_liquidity(liquidity, sp, sa, sb),
            amount1_for_liquidity(liquidity, sp, sa, sb)};
}

TokenAmounts amounts_delta(double liquidity, double sp_from, double sp_to,
                           double sa, double sb) {
    order_bounds(sa, sb);
    sp_from = clamp_price(sp_from, sa, sb);
    sp_to = clamp_price(sp_to, sa, sb);

    TokenAmounts delta;
    delta.amount0 = liquidity * (1.0 / sp_to - 1.0 / sp_from);
    delta.amount1 = liquidity * (sp_to - sp_from);
    return delta;
}

} // namespace liquidity_math
} // namespace clamm
