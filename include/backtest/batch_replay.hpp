#pragma once

/**
 * Batch backtest replay
 *
 * A batch is a subdirectory of the plan's backtest_dir holding one
 * <SYMBOL>.csv per instrument:
 *
 *   timestamp,open,high,low,close,volume      (header optional)
 *   1704205800000,187.15,187.40,186.90,187.02,120344
 *
 * timestamp is epoch milliseconds. Every bar of a symbol file is fed, in
 * file order, to a fresh set of the plan's strategies.
 */

#include "../config/plan_config.hpp"
#include "../logging/async_logger.hpp"
#include "../strategy/strategy_factory.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpt {
namespace backtest {

/**
 * Sorted batch ids (subdirectory names) under dir.
 */
inline std::vector<std::string> list_batches(const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<std::string> out;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw std::runtime_error("Backtest directory not found: " + dir);
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) {
            out.push_back(entry.path().filename().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

struct CsvLoadResult {
    BarSeries bars;
    size_t skipped_rows = 0;
};

/**
 * Load one-minute bars from CSV.
 *
 * Non-strict: malformed rows are skipped and counted.
 * Strict: the first malformed row throws std::runtime_error.
 */
inline CsvLoadResult load_bar_csv(const std::string& filename, bool strict) {
    CsvLoadResult result;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    size_t line_no = 0;
    bool first_line = true;

    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Skip header if present
        if (first_line && line.find("timestamp") != std::string::npos) {
            first_line = false;
            continue;
        }
        first_line = false;

        if (line.empty())
            continue;

        std::stringstream ss(line);
        std::string token;
        std::vector<std::string> tokens;

        while (std::getline(ss, token, ',')) {
            tokens.push_back(token);
        }

        try {
            if (tokens.size() < 6) {
                throw std::invalid_argument("expected 6 columns");
            }
            Bar b;
            b.timestamp = static_cast<Timestamp>(std::stoll(tokens[0])) * NS_PER_MS;
            b.open = std::stod(tokens[1]);
            b.high = std::stod(tokens[2]);
            b.low = std::stod(tokens[3]);
            b.close = std::stod(tokens[4]);
            b.volume = static_cast<uint64_t>(std::stod(tokens[5]));
            if (b.high < b.low) {
                throw std::invalid_argument("high below low");
            }
            if (!result.bars.empty() && b.timestamp <= result.bars.back().timestamp) {
                throw std::invalid_argument("timestamps not increasing");
            }
            result.bars.push_back(b);
        } catch (const std::logic_error& e) {
            // std::invalid_argument / std::out_of_range from stoll, stod and the checks above
            if (strict) {
                throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": " + e.what());
            }
            result.skipped_rows++;
        }
    }

    return result;
}

struct ReplaySummary {
    std::string batch_id;
    size_t symbols = 0;
    uint64_t bars = 0;
    size_t skipped_rows = 0;
};

/**
 * Replays batches through the plan's strategies.
 */
class BatchReplayer {
public:
    BatchReplayer(const config::PlanConfig& plan, logging::AsyncLogger& logger) : plan_(plan), logger_(logger) {}

    /**
     * @param batch_id      subdirectory of backtest_dir
     * @param debug_symbols restrict to these symbols (empty = all)
     * @param strict        malformed rows / missing debug symbols are errors
     */
    ReplaySummary replay(const std::string& batch_id, const std::vector<std::string>& debug_symbols, bool strict) {
        namespace fs = std::filesystem;
        const fs::path dir = fs::path(plan_.backtest_dir) / batch_id;

        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            throw std::runtime_error("Unknown batch: " + batch_id);
        }

        std::vector<std::pair<std::string, fs::path>> files;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".csv") {
                files.emplace_back(util::normalize_symbol(entry.path().stem().string()), entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        if (!debug_symbols.empty()) {
            std::vector<std::pair<std::string, fs::path>> selected;
            for (const auto& sym : debug_symbols) {
                auto it = std::find_if(files.begin(), files.end(), [&](const auto& f) { return f.first == sym; });
                if (it == files.end()) {
                    if (strict) {
                        throw std::runtime_error("Debug symbol " + sym + " not in batch " + batch_id);
                    }
                    MPT_LOGF_WARN(logger_, Backtest, "debug symbol %s not in batch %s", sym.c_str(), batch_id.c_str());
                    continue;
                }
                selected.push_back(*it);
            }
            files = std::move(selected);
        }

        ReplaySummary summary;
        summary.batch_id = batch_id;

        auto strategies = strategy::StrategyFactory::create_all(plan_.strategies, logger_);
        for (const auto& [symbol, path] : files) {
            CsvLoadResult loaded = load_bar_csv(path.string(), strict);
            summary.skipped_rows += loaded.skipped_rows;
            if (loaded.skipped_rows > 0) {
                MPT_LOGF_WARN(logger_, Backtest, "%s: skipped %zu malformed rows", symbol.c_str(),
                              loaded.skipped_rows);
            }

            // Same history bound as a live consumer
            const size_t cap = static_cast<size_t>(std::max(1, plan_.warm_up_bars));
            BarSeries history;
            for (auto& s : strategies) {
                s->on_symbol(symbol, history);
            }
            for (const Bar& bar : loaded.bars) {
                history.push_back(bar);
                if (history.size() > cap) {
                    history.erase(history.begin());
                }
                for (auto& s : strategies) {
                    s->on_bar(symbol, bar, history);
                }
            }
            summary.symbols++;
            summary.bars += loaded.bars.size();
        }
        for (auto& s : strategies) {
            s->on_session_end();
        }

        MPT_LOGF_INFO(logger_, Backtest, "batch %s: %zu symbols, %llu bars", batch_id.c_str(), summary.symbols,
                      static_cast<unsigned long long>(summary.bars));
        return summary;
    }

private:
    const config::PlanConfig& plan_;
    logging::AsyncLogger& logger_;
};

} // namespace backtest
} // namespace mpt
