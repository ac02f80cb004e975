#pragma once

#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <string>

namespace mpt {
namespace strategy {

/**
 * Strategy interface for minute-bar consumers
 *
 * One instance per consumer process (or per backtest batch). Calls arrive
 * in bar order per symbol from a single thread.
 */
class IBarStrategy {
public:
    virtual ~IBarStrategy() = default;

    virtual const char* name() const = 0;

    // Symbol enters this consumer, with its warm-up history (may be empty)
    virtual void on_symbol(const std::string& symbol, const BarSeries& history) {
        (void)symbol;
        (void)history;
    }

    // history already includes `bar` as its last element
    virtual void on_bar(const std::string& symbol, const Bar& bar, const BarSeries& history) = 0;

    virtual void on_session_end() {}
};

// =============================================================================
// bar_logger: logs every Nth bar
// =============================================================================

class BarLogger : public IBarStrategy {
public:
    BarLogger(logging::AsyncLogger& logger, int every) : logger_(logger), every_(std::max(1, every)) {}

    const char* name() const override { return "bar_logger"; }

    void on_symbol(const std::string& symbol, const BarSeries& history) override {
        MPT_LOGF_INFO(logger_, Strategy, "%s: tracking, %zu warm-up bars", symbol.c_str(), history.size());
    }

    void on_bar(const std::string& symbol, const Bar& bar, const BarSeries& history) override {
        (void)history;
        if (++count_ % static_cast<uint64_t>(every_) != 0) {
            return;
        }
        MPT_LOGF_INFO(logger_, Strategy, "%s %s O=%.4f H=%.4f L=%.4f C=%.4f V=%llu", symbol.c_str(),
                      util::format_utc(bar.timestamp).c_str(), bar.open, bar.high, bar.low, bar.close,
                      static_cast<unsigned long long>(bar.volume));
    }

    uint64_t bars_seen() const { return count_; }

private:
    logging::AsyncLogger& logger_;
    int every_;
    uint64_t count_ = 0;
};

// =============================================================================
// session_stats: per-symbol bar count, VWAP and range, reported at the end
// =============================================================================

struct SymbolStats {
    uint64_t bars = 0;
    uint64_t volume = 0;
    double notional = 0.0; // sum(close * volume)
    double high = std::numeric_limits<double>::lowest();
    double low = std::numeric_limits<double>::max();
    double last = 0.0;

    double vwap() const { return volume > 0 ? notional / static_cast<double>(volume) : last; }
};

class SessionStats : public IBarStrategy {
public:
    explicit SessionStats(logging::AsyncLogger& logger) : logger_(logger) {}

    const char* name() const override { return "session_stats"; }

    void on_symbol(const std::string& symbol, const BarSeries& history) override {
        (void)history;
        stats_.emplace(symbol, SymbolStats{});
    }

    void on_bar(const std::string& symbol, const Bar& bar, const BarSeries& history) override {
        (void)history;
        SymbolStats& s = stats_[symbol];
        s.bars++;
        s.volume += bar.volume;
        s.notional += bar.close * static_cast<double>(bar.volume);
        s.high = std::max(s.high, bar.high);
        s.low = std::min(s.low, bar.low);
        s.last = bar.close;
    }

    void on_session_end() override {
        for (const auto& [symbol, s] : stats_) {
            if (s.bars == 0) {
                MPT_LOGF_INFO(logger_, Strategy, "%s: no bars this session", symbol.c_str());
                continue;
            }
            MPT_LOGF_INFO(logger_, Strategy, "%s: %llu bars, vwap %.4f, range %.4f-%.4f, last %.4f", symbol.c_str(),
                          static_cast<unsigned long long>(s.bars), s.vwap(), s.low, s.high, s.last);
        }
    }

    const std::map<std::string, SymbolStats>& stats() const { return stats_; }

private:
    logging::AsyncLogger& logger_;
    std::map<std::string, SymbolStats> stats_;
};

} // namespace strategy
} // namespace mpt
