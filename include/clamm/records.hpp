#ifndef CLAMM_RECORDS_HPP
#define CLAMM_RECORDS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "analytics.hpp"
#include "distribution.hpp"
#include "position.hpp"
#include "types.hpp"
#include "wide_int.hpp"

namespace clamm {

// =============================================================================
// Pool Snapshot
// =============================================================================

struct TokenInfo {
    std::string symbol;
    int decimals = 0;
};

struct PoolSnapshot {
    int32_t tick = 0;
    U128 liquidity = 0;
    uint32_t fee_tier = 0;
    U256 sqrt_price_x96;            // Zero when the record carries no sqrtPrice
    TokenInfo token0;
    TokenInfo token1;

    int32_t tick_spacing() const;

    // From sqrtPrice when present, otherwise derived from the tick
    double sqrt_price() const;

    // Raw price (token1 base units per token0 base unit) at the current tick
    double price() const;

    // Price in whole tokens, corrected for decimals
    double adjusted_price() const;
};

// =============================================================================
// Record Decoding
// =============================================================================
//
// Each parser accepts the bare record (object or array) or the full GraphQL
// response envelope {"data": {...}}. Integer fields may be JSON numbers or
// decimal strings; 128-bit fields must be strings once they exceed 64 bits.
// Malformed input throws RecordError naming the offending field.

PoolSnapshot parse_pool(const nlohmann::json& j);

// Merges all pages into one map; repeated ticks are summed
TickDeltaMap parse_ticks(const nlohmann::json& j);

std::vector<Position> parse_positions(const nlohmann::json& j);

// Pool day data, in the order given (newest first for subgraph queries)
std::vector<DailyVolume> parse_day_data(const nlohmann::json& j);

// Read and parse a JSON document. Throws RecordError if the file cannot be
// opened or is not valid JSON.
nlohmann::json load_json_file(const std::string& path);

} // namespace clamm

#endif // CLAMM_RECORDS_HPP
