// =============================================================================
// records.cpp - Subgraph JSON record decoding
// =============================================================================

#include "clamm/records.hpp"
#include "clamm/tick_math.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>

namespace clamm {

using json = nlohmann::json;

namespace {

// Strip the GraphQL envelope and descend through the first matching key
const json& unwrap(const json& j, std::initializer_list<const char*> keys) {
    const json* cur = &j;
    if (cur->is_object() && cur->contains("data")) {
        cur = &cur->at("data");
    }
    for (const char* key : keys) {
        if (cur->is_object() && cur->contains(key)) {
            return cur->at(key);
        }
    }
    return *cur;
}

std::string field_error(const char* name, const std::string& what) {
    return std::string("Field '") + name + "': " + what;
}

const json& field(const json& obj, const char* name) {
    if (!obj.is_object() || !obj.contains(name) || obj.at(name).is_null()) {
        throw RecordError(field_error(name, "missing"));
    }
    return obj.at(name);
}

std::string integer_text(const json& v, const char* name) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    throw RecordError(field_error(name, "not an integer"));
}

I128 get_i128(const json& obj, const char* name) {
    std::string text = integer_text(field(obj, name), name);
    try {
        return wide::parse_i128(text);
    } catch (const RecordError& e) {
        throw RecordError(field_error(name, e.what()));
    }
}

U128 get_u128(const json& obj, const char* name) {
    std::string text = integer_text(field(obj, name), name);
    try {
        return wide::parse_u128(text);
    } catch (const RecordError& e) {
        throw RecordError(field_error(name, e.what()));
    }
}

U256 get_u256(const json& obj, const char* name) {
    std::string text = integer_text(field(obj, name), name);
    try {
        return wide::parse_u256(text);
    } catch (const RecordError& e) {
        throw RecordError(field_error(name, e.what()));
    }
}

template <typename T>
T get_narrow(const json& obj, const char* name) {
    I128 v = get_i128(obj, name);
    if (v < static_cast<I128>(std::numeric_limits<T>::min()) ||
        v > static_cast<I128>(std::numeric_limits<T>::max())) {
        throw RecordError(field_error(name, "value " + wide::to_string(v) + " out of range"));
    }
    return static_cast<T>(v);
}

// A tick index inside [MIN_TICK, MAX_TICK]; label names the field in errors
int32_t get_tick(const json& obj, const char* name, const char* label) {
    int32_t tick = get_narrow<int32_t>(obj, name);
    if (!tick_math::is_valid_tick(tick)) {
        throw RecordError(field_error(label, "tick " + std::to_string(tick) +
                                             " outside the valid tick range"));
    }
    return tick;
}

double get_double(const json& obj, const char* name) {
    const json& v = field(obj, name);
    if (v.is_number()) return v.get<double>();
    if (!v.is_string()) {
        throw RecordError(field_error(name, "not a number"));
    }
    const std::string text = v.get<std::string>();
    try {
        size_t used = 0;
        double d = std::stod(text, &used);
        if (used != text.size()) {
            throw RecordError(field_error(name, "invalid number '" + text + "'"));
        }
        return d;
    } catch (const std::invalid_argument&) {
        throw RecordError(field_error(name, "invalid number '" + text + "'"));
    } catch (const std::out_of_range&) {
        throw RecordError(field_error(name, "number '" + text + "' out of range"));
    }
}

std::string get_id(const json& obj) {
    if (!obj.contains("id") || obj.at("id").is_null()) return "";
    const json& v = obj.at("id");
    if (v.is_string()) return v.get<std::string>();
    return integer_text(v, "id");
}

TokenInfo parse_token(const json& pool, const char* name) {
    TokenInfo token;
    token.symbol = name;
    if (!pool.contains(name) || pool.at(name).is_null()) {
        return token;
    }
    const json& t = pool.at(name);
    if (t.contains("symbol") && t.at("symbol").is_string()) {
        token.symbol = t.at("symbol").get<std::string>();
    }
    token.decimals = get_narrow<int>(t, "decimals");
    return token;
}

const json& first_pool(const json& j) {
    const json& pools = unwrap(j, {"pools", "pool"});
    if (pools.is_array()) {
        if (pools.empty()) {
            throw RecordError("pool not found");
        }
        return pools.front();
    }
    if (!pools.is_object()) {
        throw RecordError("Pool record must be an object");
    }
    return pools;
}

void collect_ticks(const json& j, TickDeltaMap& out) {
    const json& items = unwrap(j, {"ticks"});
    if (!items.is_array()) {
        throw RecordError("Tick records must be an array");
    }
    for (const auto& item : items) {
        if (item.is_object() && item.contains("tickIdx")) {
            out[get_tick(item, "tickIdx", "tickIdx")] += get_i128(item, "liquidityNet");
        } else {
            // A saved page of a paginated query
            collect_ticks(item, out);
        }
    }
}

void collect_positions(const json& j, std::vector<Position>& out) {
    const json& items = unwrap(j, {"positions", "position"});
    if (items.is_object() && items.contains("liquidity")) {
        Position position;
        position.id = get_id(items);
        position.liquidity = get_u128(items, "liquidity");
        position.tick_lower = get_tick(field(items, "tickLower"), "tickIdx", "tickLower");
        position.tick_upper = get_tick(field(items, "tickUpper"), "tickIdx", "tickUpper");
        out.push_back(std::move(position));
        return;
    }
    if (!items.is_array()) {
        throw RecordError("Position records must be an array");
    }
    for (const auto& item : items) {
        collect_positions(item, out);
    }
}

} // namespace

// =============================================================================
// PoolSnapshot
// =============================================================================

int32_t PoolSnapshot::tick_spacing() const {
    return tick_math::fee_tier_to_tick_spacing(fee_tier);
}

double PoolSnapshot::sqrt_price() const {
    if (sqrt_price_x96.is_zero()) {
        return tick_math::tick_to_sqrt_price(tick);
    }
    return tick_math::sqrt_price_from_x96(sqrt_price_x96);
}

double PoolSnapshot::price() const {
    return tick_math::tick_to_price(tick);
}

double PoolSnapshot::adjusted_price() const {
    return tick_math::adjust_price_for_decimals(price(), token0.decimals, token1.decimals);
}

// =============================================================================
// Parsers
// =============================================================================

PoolSnapshot parse_pool(const json& j) {
    const json& pool = first_pool(j);

    PoolSnapshot snapshot;
    snapshot.tick = get_tick(pool, "tick", "tick");
    if (pool.contains("liquidity") && !pool.at("liquidity").is_null()) {
        snapshot.liquidity = get_u128(pool, "liquidity");
    }
    if (pool.contains("feeTier") && !pool.at("feeTier").is_null()) {
        snapshot.fee_tier = get_narrow<uint32_t>(pool, "feeTier");
    }
    if (pool.contains("sqrtPrice") && !pool.at("sqrtPrice").is_null()) {
        snapshot.sqrt_price_x96 = get_u256(pool, "sqrtPrice");
    }
    snapshot.token0 = parse_token(pool, "token0");
    snapshot.token1 = parse_token(pool, "token1");
    return snapshot;
}

TickDeltaMap parse_ticks(const json& j) {
    TickDeltaMap deltas;
    collect_ticks(j, deltas);
    return deltas;
}

std::vector<Position> parse_positions(const json& j) {
    std::vector<Position> positions;
    collect_positions(j, positions);
    return positions;
}

std::vector<DailyVolume> parse_day_data(const json& j) {
    const json* items = &unwrap(j, {"pools", "pool", "poolDayData"});
    if (items->is_array() && !items->empty() && items->front().contains("poolDayData")) {
        items = &items->front();
    }
    if (items->is_object() && items->contains("poolDayData")) {
        items = &items->at("poolDayData");
    }
    if (!items->is_array()) {
        throw RecordError("Day data records must be an array");
    }

    std::vector<DailyVolume> days;
    days.reserve(items->size());
    for (const auto& item : *items) {
        DailyVolume day;
        day.date = get_narrow<int64_t>(item, "date");
        day.volume = get_double(item, "volumeUSD");
        days.push_back(day);
    }
    return days;
}

json load_json_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw RecordError("Cannot open record file: " + path);
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw RecordError("Invalid JSON in record file: " + path);
    }
    return j;
}

} // namespace clamm
