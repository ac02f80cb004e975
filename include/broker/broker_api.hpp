#pragma once

#include "../types.hpp"
#include "../util/cancellation.hpp"
#include "../util/time_utils.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mpt {
namespace broker {

/**
 * Transport or protocol failure talking to the broker / market-data API.
 */
class BrokerError : public std::runtime_error {
public:
    explicit BrokerError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * One exchange session as published by the calendar.
 */
struct CalendarDay {
    util::CivilDate date;
    TradingWindow window;
};

struct OpenPosition {
    std::string symbol;
    double qty = 0.0;
    double cost_basis = 0.0;
};

// ============================================================================
// Collaborator interfaces consumed by the orchestrator and its workers
// ============================================================================

class ICalendarSource {
public:
    virtual ~ICalendarSource() = default;

    /// First session on or after `date`; nullopt when the calendar has none
    virtual std::optional<CalendarDay> session_for(const util::CivilDate& date) = 0;
};

class IPositionSource {
public:
    virtual ~IPositionSource() = default;

    virtual std::vector<OpenPosition> list_open_positions() = 0;
};

class IHistoryLoader {
public:
    virtual ~IHistoryLoader() = default;

    /// At most max_count most-recent minute bars per symbol. Symbols that
    /// could not be loaded are absent from the result. Stops early, with a
    /// partial result, once the token is cancelled.
    virtual WarmUpResult warm_up(const std::vector<std::string>& symbols, int max_count,
                                 const util::CancellationToken& token) = 0;
};

class IMarketFeed {
public:
    virtual ~IMarketFeed() = default;

    /// Latest completed minute bar for each symbol the feed knows about
    virtual std::vector<std::pair<std::string, Bar>> latest_bars(const std::vector<std::string>& symbols) = 0;
};

class IScreener {
public:
    virtual ~IScreener() = default;

    /// Most active symbols by volume, best first
    virtual std::vector<std::string> most_actives(int top) = 0;
};

} // namespace broker
} // namespace mpt
