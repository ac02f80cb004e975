#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mpt {

// Wall-clock nanoseconds since Unix epoch (UTC)
using Timestamp = int64_t;
using ShardId = int;
using RunId = uint64_t;

constexpr Timestamp NS_PER_SECOND = 1'000'000'000LL;
constexpr Timestamp NS_PER_MINUTE = 60 * NS_PER_SECOND;
constexpr Timestamp NS_PER_MS = 1'000'000LL;

// Longest symbol carried through shared-memory queues (excluding terminator)
constexpr size_t MAX_SYMBOL_LEN = 15;

/**
 * Trading session bounds for one day. Invariant: open < close.
 */
struct TradingWindow {
    Timestamp open = 0;
    Timestamp close = 0;

    bool valid() const { return open < close; }
    bool contains(Timestamp t) const { return t >= open && t < close; }
};

/**
 * One-minute OHLCV bar
 */
struct Bar {
    Timestamp timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    uint64_t volume = 0;
};

using BarSeries = std::vector<Bar>;

// symbol -> warm-up history; its key set finalizes the instrument universe
using WarmUpResult = std::map<std::string, BarSeries>;

/**
 * Render a run id the way it appears in logs and shared-memory names.
 */
inline std::string run_id_to_string(RunId id) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = HEX[id & 0xF];
        id >>= 4;
    }
    return out;
}

} // namespace mpt
