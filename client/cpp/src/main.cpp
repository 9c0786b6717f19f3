// clamm command-line client
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Reports on concentrated-liquidity pools from saved subgraph snapshots
// (JSON), and answers position-sizing questions from plain numbers.

#include "clamm/analytics.hpp"
#include "clamm/bound_solver.hpp"
#include "clamm/config.hpp"
#include "clamm/display.hpp"
#include "clamm/distribution.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/log.hpp"
#include "clamm/position.hpp"
#include "clamm/records.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string pool_path;
    std::string ticks_path;
    std::string positions_path;
    std::string days_path;
    bool anchored = false;
    bool verbose = false;
    std::vector<std::string> command_args;
};

void print_usage(const char* prog) {
    std::cout << "clamm concentrated-liquidity calculator\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>     TOML configuration file\n"
              << "  -p, --pool <file>       Pool snapshot (JSON)\n"
              << "  -t, --ticks <file>      Tick records (JSON)\n"
              << "  -P, --positions <file>  Position records (JSON)\n"
              << "  -d, --days <file>       Pool day data (JSON, default: pool file)\n"
              << "  -a, --anchored          Anchor the distribution at the pool liquidity\n"
              << "  -v, --verbose           Verbose output\n"
              << "  -h, --help              Show this help message\n\n"
              << "Commands:\n"
              << "  distribution                  Locked amounts per tick range\n"
              << "  positions                     Value all positions at the current price\n"
              << "  position <id>                 Value one position\n"
              << "  current                       Amounts in the current tick range\n"
              << "  iv                            Fee-implied volatility per day\n"
              << "  bounds <x> <y> <p> <a> <b>    Recover range bounds from amounts\n"
              << "  deposit <x> <p> <a> <b> [p2]  token1 needed next to x token0\n\n"
              << "Examples:\n"
              << "  " << prog << " -p pool.json -t ticks.json distribution\n"
              << "  " << prog << " -p pool.json -P positions.json positions\n"
              << "  " << prog << " bounds 1 4 20 19.027 25.993\n"
              << "  " << prog << " deposit 2 2000 1500 2500 2500\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    auto take_value = [&](int& i, const char* what) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Missing " << what << " argument\n";
            std::exit(1);
        }
        return argv[++i];
    };

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            options.config_path = take_value(i, "config file");
        } else if (arg == "-p" || arg == "--pool") {
            options.pool_path = take_value(i, "pool file");
        } else if (arg == "-t" || arg == "--ticks") {
            options.ticks_path = take_value(i, "ticks file");
        } else if (arg == "-P" || arg == "--positions") {
            options.positions_path = take_value(i, "positions file");
        } else if (arg == "-d" || arg == "--days") {
            options.days_path = take_value(i, "day data file");
        } else if (arg == "-a" || arg == "--anchored") {
            options.anchored = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-' || (arg.size() > 1 &&
                   (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.'))) {
            // Command and its arguments; a leading '-' digit is a number
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
        ++i;
    }

    return options;
}

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

double parse_number(const std::string& text, const char* name) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("Invalid ") + name + ": " + text);
    }
    if (used != text.size() || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("Invalid ") + name + ": " + text);
    }
    return value;
}

const std::string& require_path(const std::string& path, const char* option) {
    if (path.empty()) {
        throw std::invalid_argument(std::string("Command needs ") + option);
    }
    return path;
}

clamm::PoolSnapshot load_pool(const Options& options) {
    const std::string& path = require_path(options.pool_path, "--pool");
    clamm::logger().debug("Loading pool snapshot from " + path);
    clamm::PoolSnapshot pool = clamm::parse_pool(clamm::load_json_file(path));
    clamm::logger().debug("Pool tick=" + std::to_string(pool.tick) +
                          " liquidity=" + clamm::wide::to_string(pool.liquidity) +
                          " fee_tier=" + std::to_string(pool.fee_tier));
    return pool;
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int run_distribution(const Options& options, const clamm::Config& config) {
    clamm::PoolSnapshot pool = load_pool(options);
    const std::string& ticks_path = require_path(options.ticks_path, "--ticks");
    clamm::TickDeltaMap deltas = clamm::parse_ticks(clamm::load_json_file(ticks_path));
    clamm::logger().info("Loaded " + std::to_string(deltas.size()) + " initialized ticks");

    double price = pool.sqrt_price() * pool.sqrt_price();
    clamm::Distribution dist = options.anchored
        ? clamm::aggregate_range_distribution_anchored(deltas, pool.tick, pool.tick_spacing(),
                                                       price, pool.liquidity)
        : clamm::aggregate_range_distribution(deltas, pool.tick, pool.tick_spacing(), price);

    if (!options.anchored && dist.current_range() != nullptr &&
        dist.current_liquidity != static_cast<clamm::I128>(pool.liquidity)) {
        clamm::logger().warn("Swept liquidity at the current range (" +
                             clamm::wide::to_string(dist.current_liquidity) +
                             ") differs from the pool (" +
                             clamm::wide::to_string(pool.liquidity) +
                             "); tick records may be incomplete");
    }

    auto view = clamm::display::PriceView::for_pool(pool, config.analysis.stablecoins);
    clamm::display::write_distribution(std::cout, dist, pool, view,
                                       config.analysis.show_empty_ranges);
    return 0;
}

std::vector<clamm::Position> load_positions(const Options& options) {
    const std::string& path = require_path(options.positions_path, "--positions");
    std::vector<clamm::Position> positions = clamm::parse_positions(clamm::load_json_file(path));
    clamm::logger().info("Loaded " + std::to_string(positions.size()) + " positions");
    return positions;
}

int run_positions(const Options& options) {
    clamm::PoolSnapshot pool = load_pool(options);
    clamm::PortfolioValue portfolio =
        clamm::value_positions(load_positions(options), pool.tick, pool.sqrt_price());

    if (!portfolio.matches_pool(pool.liquidity)) {
        clamm::logger().warn("Active position liquidity does not add up to the pool liquidity");
    }
    clamm::display::write_positions(std::cout, portfolio, pool);
    return 0;
}

int run_position(const Options& options, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: position <id>\n";
        return 1;
    }
    clamm::PoolSnapshot pool = load_pool(options);
    std::vector<clamm::Position> positions = load_positions(options);

    auto it = std::find_if(positions.begin(), positions.end(),
        [&](const clamm::Position& p) { return p.id == args[1]; });
    if (it == positions.end()) {
        clamm::logger().error("position not found: " + args[1]);
        return 1;
    }

    clamm::PositionValue value = clamm::value_position(*it, pool.tick, pool.sqrt_price());
    clamm::display::write_position(std::cout, value, pool);
    return 0;
}

int run_current(const Options& options) {
    clamm::PoolSnapshot pool = load_pool(options);
    clamm::TokenAmounts amounts = clamm::current_range_amounts(
        pool.liquidity, pool.tick, pool.tick_spacing(), pool.sqrt_price());
    clamm::display::write_current_range(std::cout, pool, amounts);
    return 0;
}

int run_iv(const Options& options, const clamm::Config& config) {
    clamm::PoolSnapshot pool = load_pool(options);
    const std::string& days_path = options.days_path.empty() ? options.pool_path
                                                             : options.days_path;
    std::vector<clamm::DailyVolume> days =
        clamm::parse_day_data(clamm::load_json_file(days_path));

    // Running day plus the requested number of full days
    size_t keep = static_cast<size_t>(config.analysis.iv_days) + 1;
    if (days.size() > keep) {
        days.resize(keep);
    }
    if (days.size() < 2) {
        clamm::logger().warn("Not enough day data for a volatility estimate");
    }

    double locked = clamm::display::to_display_amount(
        clamm::current_range_value0(pool.liquidity, pool.tick, pool.tick_spacing()),
        pool.token0.decimals);
    double fee_rate = clamm::fee_tier_to_rate(pool.fee_tier);

    auto series = clamm::implied_volatility_series(fee_rate, days, locked);
    clamm::display::write_volatility(std::cout, locked, pool.token0.symbol, series);
    return 0;
}

int run_bounds(const std::vector<std::string>& args, const clamm::Config& config) {
    if (args.size() != 6) {
        std::cerr << "Usage: bounds <x> <y> <p> <a> <b>\n";
        return 1;
    }
    double x = parse_number(args[1], "x");
    double y = parse_number(args[2], "y");
    double p = parse_number(args[3], "p");
    double a = parse_number(args[4], "a");
    double b = parse_number(args[5], "b");

    double sp = std::sqrt(p);
    double sa = std::sqrt(a);
    double sb = std::sqrt(b);
    double tolerance = config.analysis.bound_tolerance;

    double liquidity = clamm::liquidity_math::liquidity_for_amounts(x, y, sp, sa, sb);
    std::cout << "L: " << clamm::display::format_fixed(liquidity, 2) << "\n";

    auto lower = clamm::bound_solver::check_lower_bound(x, y, sp, sb, liquidity, tolerance);
    auto upper = clamm::bound_solver::check_upper_bound(x, y, sp, sa, liquidity, tolerance);
    clamm::display::write_bound_check(std::cout, "a", a, lower);
    clamm::display::write_bound_check(std::cout, "b", b, upper);

    double c = sb / sp;
    double d = sa / sp;
    double ic = clamm::bound_solver::upper_ratio(p, d, x, y);
    double id = clamm::bound_solver::lower_ratio(p, c, x, y);
    clamm::PriceRange range = clamm::bound_solver::bounds_from_ratios(p, ic, id);
    std::cout << "from ratios: p_a=" << clamm::display::format_fixed(range.lower, 2)
              << " p_b=" << clamm::display::format_fixed(range.upper, 2) << "\n";

    auto amounts = clamm::liquidity_math::amounts_for_liquidity(liquidity, sp, sa, sb);
    std::cout << "x: " << clamm::display::format_fixed(x, 2) << " vs "
              << clamm::display::format_fixed(amounts.amount0, 2) << "\n";
    std::cout << "y: " << clamm::display::format_fixed(y, 2) << " vs "
              << clamm::display::format_fixed(amounts.amount1, 2) << "\n";

    if (!lower.within_tolerance || !upper.within_tolerance) {
        clamm::logger().warn("Recovered bounds disagree beyond tolerance " +
                             clamm::display::format_fixed(tolerance, 4));
    }
    return 0;
}

int run_deposit(const std::vector<std::string>& args) {
    if (args.size() != 5 && args.size() != 6) {
        std::cerr << "Usage: deposit <x> <p> <a> <b> [p2]\n";
        return 1;
    }
    double x = parse_number(args[1], "x");
    double p = parse_number(args[2], "p");
    double a = parse_number(args[3], "a");
    double b = parse_number(args[4], "b");

    double sp = std::sqrt(p);
    double sa = std::sqrt(a);
    double sb = std::sqrt(b);

    double liquidity = clamm::liquidity_math::liquidity_for_amount0(x, sp, sb);
    double y = clamm::liquidity_math::amount1_for_liquidity(liquidity, sp, sa, sb);
    std::cout << "amount of token1 y=" << clamm::display::format_fixed(y, 2) << "\n";

    double ic = clamm::bound_solver::upper_ratio(p, sa / sp, x, y);
    double id = clamm::bound_solver::lower_ratio(p, sb / sp, x, y);
    clamm::PriceRange range = clamm::bound_solver::bounds_from_ratios(p, ic, id);
    std::cout << "p_a=" << clamm::display::format_fixed(range.lower, 2)
              << " (" << clamm::display::format_fixed(100.0 * range.lower / p, 2) << "% of P)"
              << ", p_b=" << clamm::display::format_fixed(range.upper, 2)
              << " (" << clamm::display::format_fixed(100.0 * range.upper / p, 2) << "% of P)\n";

    if (args.size() == 6) {
        double p2 = parse_number(args[5], "p2");
        auto delta = clamm::liquidity_math::amounts_delta(liquidity, sp, std::sqrt(p2), sa, sb);
        std::cout << "at p=" << clamm::display::format_fixed(p2, 2)
                  << ": x=" << clamm::display::format_fixed(x + delta.amount0, 4)
                  << " y=" << clamm::display::format_fixed(y + delta.amount1, 2) << "\n";
    }
    return 0;
}

int run_command(const Options& options, const clamm::Config& config) {
    const auto& args = options.command_args;
    const std::string& command = args[0];

    if (command == "distribution") return run_distribution(options, config);
    if (command == "positions") return run_positions(options);
    if (command == "position") return run_position(options, args);
    if (command == "current") return run_current(options);
    if (command == "iv") return run_iv(options, config);
    if (command == "bounds") return run_bounds(args, config);
    if (command == "deposit") return run_deposit(args);

    std::cerr << "Unknown command: " << command << "\n";
    return 1;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);
    if (options.command_args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        clamm::Config config = options.config_path.empty()
            ? clamm::Config{}
            : clamm::Config::from_file(options.config_path);
        if (options.verbose) {
            config.enable_verbose();
        }
        clamm::logger().set_level(config.effective_log_level());

        return run_command(options, config);
    } catch (const clamm::ConfigError& e) {
        clamm::logger().error(std::string("config: ") + e.what());
    } catch (const clamm::RecordError& e) {
        clamm::logger().error(std::string("record: ") + e.what());
    } catch (const clamm::DomainError& e) {
        clamm::logger().error(std::string("math: ") + e.what());
    } catch (const std::invalid_argument& e) {
        clamm::logger().error(e.what());
    }
    return 1;
}
