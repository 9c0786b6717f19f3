#ifndef CLAMM_LIQUIDITY_MATH_HPP
#define CLAMM_LIQUIDITY_MATH_HPP

#include "types.hpp"

namespace clamm {

// =============================================================================
// Liquidity Math Utilities
// =============================================================================
//
// All prices here are square roots: sp = sqrt(P), sa = sqrt(Pa), sb = sqrt(Pb).
// x is the token0 amount, y the token1 amount. Bounds given in reverse order
// are swapped; a zero-width range throws DomainError.

namespace liquidity_math {

// Liquidity backed by token0 only (price at or below the range)
// L = x * sa * sb / (sb - sa)
double liquidity_for_amount0(double x, double sa, double sb);

// Liquidity backed by token1 only (price at or above the range)
// L = y / (sb - sa)
double liquidity_for_amount1(double y, double sa, double sb);

// Liquidity from both amounts at the current price. Inside the range the
// asset that runs out first binds.
double liquidity_for_amounts(double x, double y, double sp, double sa, double sb);

// token0 held by liquidity L; sp is clamped into [sa, sb]
double amount0_for_liquidity(double liquidity, double sp, double sa, double sb);

// token1 held by liquidity L; sp is clamped into [sa, sb]
double amount1_for_liquidity(double liquidity, double sp, double sa, double sb);

TokenAmounts amounts_for_liquidity(double liquidity, double sp, double sa, double sb);

// Change in holdings when the price moves from sp_from to sp_to. Both prices
// are clamped into the range, so moves outside it contribute nothing.
TokenAmounts amounts_delta(double liquidity, double sp_from, double sp_to,
                           double sa, double sb);

} // namespace liquidity_math

} // namespace clamm

#endif // CLAMM_LIQUIDITY_MATH_HPP
