// =============================================================================
// tick_math.cpp - Tick <-> price conversion and tick spacing
// =============================================================================

#include "clamm/tick_math.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace clamm {
namespace tick_math {

double tick_to_price(double tick) noexcept {
    return std::pow(TICK_BASE, tick);
}

double tick_to_sqrt_price(double tick) noexcept {
    return tick_to_price(tick / 2.0);
}

int32_t price_to_tick(double price) {
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw DomainError("price_to_tick: price must be positive and finite");
    }
    double tick_d = std::floor(std::log(price) / std::log(TICK_BASE));
    tick_d = std::max(std::min(tick_d, static_cast<double>(MAX_TICK)),
                      static_cast<double>(MIN_TICK));
    int32_t tick = static_cast<int32_t>(tick_d);

    // log() rounding can land one tick off near exact powers of the base
    if (tick > MIN_TICK && tick_to_price(tick) > price) {
        --tick;
    } else if (tick < MAX_TICK && tick_to_price(tick + 1) <= price) {
        ++tick;
    }
    return tick;
}

int32_t fee_tier_to_tick_spacing(uint32_t fee_tier) noexcept {
    switch (fee_tier) {
        case fees::FEE_001: return tick_spacings::TICK_SPACING_001;
        case fees::FEE_005: return tick_spacings::TICK_SPACING_005;
        case fees::FEE_030: return tick_spacings::TICK_SPACING_030;
        case fees::FEE_100: return tick_spacings::TICK_SPACING_100;
        default: return tick_spacings::DEFAULT;
    }
}

int32_t floor_to_spacing(int32_t tick, int32_t tick_spacing) {
    if (tick_spacing <= 0) {
        throw DomainError("Tick spacing must be positive, got " +
                          std::to_string(tick_spacing));
    }
    // C++ division truncates toward zero; correct it to floor
    int32_t q = tick / tick_spacing;
    if (tick % tick_spacing != 0 && tick < 0) {
        --q;
    }
    return q * tick_spacing;
}

double sqrt_price_from_x96(const U256& sqrt_price_x96) noexcept {
    return std::ldexp(wide::to_double(sqrt_price_x96), -Q96_BITS);
}

double adjust_price_for_decimals(double price, int decimals0, int decimals1) noexcept {
    return price / std::pow(10.0, decimals1 - decimals0);
}

} // namespace tick_math
} // namespace clamm
