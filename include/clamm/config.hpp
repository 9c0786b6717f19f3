#ifndef CLAMM_CONFIG_HPP
#define CLAMM_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bound_solver.hpp"
#include "log.hpp"

namespace clamm {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// General tool settings
struct GeneralConfig {
    std::string log_level = "info";
    bool verbose = false;
};

// Analysis and report settings
struct AnalysisConfig {
    double bound_tolerance = bound_solver::DEFAULT_TOLERANCE;

    // Quote tokens: a pool priced in one of these is shown as token1 per token0
    std::vector<std::string> stablecoins = {
        "USDC", "DAI", "USDT", "TUSD", "LUSD", "BUSD", "GUSD", "UST"
    };

    bool show_empty_ranges = false;
    int iv_days = 5;
};

class Config {
public:
    GeneralConfig general;
    AnalysisConfig analysis;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string. Unknown keys are ignored; malformed values
    // throw ConfigError.
    static Config from_toml(std::string_view content);

    // Builder methods
    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& enable_verbose() {
        general.verbose = true;
        return *this;
    }

    Config& with_bound_tolerance(double tolerance) {
        analysis.bound_tolerance = tolerance;
        return *this;
    }

    Config& with_stablecoins(std::vector<std::string> symbols) {
        analysis.stablecoins = std::move(symbols);
        return *this;
    }

    Config& with_iv_days(int days) {
        analysis.iv_days = days;
        return *this;
    }

    Config& show_empty_ranges() {
        analysis.show_empty_ranges = true;
        return *this;
    }

    // Logger level; verbose forces debug. Throws ConfigError on an unknown name.
    LogLevel effective_log_level() const;
};

} // namespace clamm

#endif // CLAMM_CONFIG_HPP
