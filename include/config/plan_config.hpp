#pragma once

#include "../util/string_utils.hpp"
#include "defaults.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpt {
namespace config {

using json = nlohmann::json;

/**
 * Raised for any trading-plan problem: missing file, malformed JSON,
 * no scanners, no strategies, unknown names. Treated as "nothing to do":
 * the trader logs it and exits cleanly.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class TradingEnv { Paper, Prod };

inline const char* trading_env_to_string(TradingEnv env) {
    return env == TradingEnv::Prod ? "PROD" : "PAPER";
}

/**
 * A named scanner or strategy with its plan parameters
 */
struct ComponentSpec {
    std::string name;
    json params = json::object();
};

/**
 * Trading plan - immutable once loaded
 *
 * Built once at startup and passed by const reference to every component;
 * forked workers receive their own copy.
 */
struct PlanConfig {
    TradingEnv env = TradingEnv::Paper;

    // Session gating
    bool bypass_market_schedule = false;
    int market_open_buffer_seconds = session::MARKET_OPEN_BUFFER_SECONDS;
    int market_cool_down_minutes = session::MARKET_COOL_DOWN_MINUTES;
    int bypass_session_minutes = session::BYPASS_SESSION_MINUTES;

    // Universe
    bool skip_existing = false;
    std::vector<std::string> watch_symbols;
    int warm_up_bars = data::WARM_UP_BARS;

    // Topology
    bool scanners_only = false;
    int num_consumers = workers::NUM_CONSUMERS;
    double proc_factor = workers::PROC_FACTOR;

    // Worker cadence
    int poll_interval_seconds = data::POLL_INTERVAL_SECONDS;
    int scan_interval_seconds = data::SCAN_INTERVAL_SECONDS;

    std::vector<ComponentSpec> scanners;
    std::vector<ComponentSpec> strategies;

    // Backtest driver
    std::string backtest_dir = backtest::BATCH_DIR;
};

/**
 * Trading plan loader (nlohmann::json)
 *
 * Format:
 * {
 *   "env": "PAPER",
 *   "num_consumers": 0,
 *   "proc_factor": 1.0,
 *   "watch_symbols": ["AAPL", "MSFT"],
 *   "scanners":   { "static": { "symbols": ["TSLA"] } },
 *   "strategies": { "bar_logger": { "every": 10 } }
 * }
 */
class PlanLoader {
public:
    /**
     * Plan file path from MPT_PLAN_DIR / MPT_PLAN_FILE (with defaults).
     */
    static std::string path_from_env() {
        const char* dir = std::getenv(plan_file::DIR_ENV);
        const char* file = std::getenv(plan_file::FILE_ENV);
        std::string d = (dir && *dir) ? dir : plan_file::DEFAULT_DIR;
        std::string f = (file && *file) ? file : plan_file::DEFAULT_FILE;
        if (!d.empty() && d.back() != '/') {
            d += '/';
        }
        return d + f;
    }

    static PlanConfig load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigError("trading plan not found: " + path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    static PlanConfig parse(const std::string& text) {
        json doc;
        try {
            doc = json::parse(text);
        } catch (const json::parse_error& e) {
            throw ConfigError(std::string("malformed trading plan: ") + e.what());
        }
        return from_json(doc);
    }

    static PlanConfig from_json(const json& doc) {
        if (!doc.is_object()) {
            throw ConfigError("trading plan must be a JSON object");
        }

        PlanConfig plan;
        try {
            const std::string env = doc.value("env", std::string("PAPER"));
            if (env == "PROD") {
                plan.env = TradingEnv::Prod;
            } else if (env == "PAPER") {
                plan.env = TradingEnv::Paper;
            } else {
                throw ConfigError("env must be PAPER or PROD, got " + env);
            }

            plan.bypass_market_schedule = doc.value("bypass_market_schedule", plan.bypass_market_schedule);
            plan.market_open_buffer_seconds = doc.value("market_open_buffer_seconds", plan.market_open_buffer_seconds);
            plan.market_cool_down_minutes = doc.value("market_cool_down_minutes", plan.market_cool_down_minutes);
            plan.bypass_session_minutes = doc.value("bypass_session_minutes", plan.bypass_session_minutes);
            plan.skip_existing = doc.value("skip_existing", plan.skip_existing);
            plan.warm_up_bars = doc.value("warm_up_bars", plan.warm_up_bars);
            plan.scanners_only = doc.value("scanners_only", plan.scanners_only);
            plan.num_consumers = doc.value("num_consumers", plan.num_consumers);
            plan.proc_factor = doc.value("proc_factor", plan.proc_factor);
            plan.poll_interval_seconds = doc.value("poll_interval_seconds", plan.poll_interval_seconds);
            plan.scan_interval_seconds = doc.value("scan_interval_seconds", plan.scan_interval_seconds);
            plan.backtest_dir = doc.value("backtest_dir", plan.backtest_dir);

            if (doc.contains("watch_symbols")) {
                for (const auto& s : doc.at("watch_symbols")) {
                    std::string sym = util::normalize_symbol(s.get<std::string>());
                    if (sym.empty()) {
                        continue;
                    }
                    if (!util::valid_symbol(sym)) {
                        throw ConfigError("watch symbol longer than " + std::to_string(MAX_SYMBOL_LEN) +
                                          " characters: " + sym);
                    }
                    plan.watch_symbols.push_back(sym);
                }
            }

            plan.scanners = parse_components(doc, "scanners");
            plan.strategies = parse_components(doc, "strategies");
        } catch (const json::exception& e) {
            throw ConfigError(std::string("invalid trading plan value: ") + e.what());
        }

        validate(plan);
        return plan;
    }

private:
    static std::vector<ComponentSpec> parse_components(const json& doc, const char* key) {
        std::vector<ComponentSpec> out;
        if (!doc.contains(key)) {
            return out;
        }
        const json& section = doc.at(key);
        if (!section.is_object()) {
            throw ConfigError(std::string(key) + " must be an object of name -> parameters");
        }
        for (auto it = section.begin(); it != section.end(); ++it) {
            ComponentSpec spec;
            spec.name = it.key();
            spec.params = it.value().is_null() ? json::object() : it.value();
            out.push_back(std::move(spec));
        }
        return out;
    }

    static void validate(const PlanConfig& plan) {
        if (plan.scanners.empty()) {
            throw ConfigError("trading plan has no scanners configured");
        }
        if (plan.strategies.empty()) {
            throw ConfigError("trading plan has no strategies configured");
        }
        if (plan.num_consumers < 0) {
            throw ConfigError("num_consumers must be >= 0");
        }
        if (!(plan.proc_factor > 0.0)) {
            throw ConfigError("proc_factor must be > 0");
        }
        if (plan.market_open_buffer_seconds < 0 || plan.market_cool_down_minutes < 0) {
            throw ConfigError("market open buffer and cool down must be >= 0");
        }
        if (plan.bypass_session_minutes <= 0) {
            throw ConfigError("bypass_session_minutes must be > 0");
        }
        if (plan.warm_up_bars < 0) {
            throw ConfigError("warm_up_bars must be >= 0");
        }
        if (plan.poll_interval_seconds < 1 || plan.scan_interval_seconds < 1) {
            throw ConfigError("poll and scan intervals must be >= 1 second");
        }
    }
};

} // namespace config
} // namespace mpt
