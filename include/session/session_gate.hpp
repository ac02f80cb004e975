#pragma once

#include "../broker/broker_api.hpp"
#include "../config/plan_config.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/cancellation.hpp"
#include "../util/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <optional>

namespace mpt {
namespace session {

enum class GateOutcome : uint8_t {
    Open,         // window already open (or opening after the wait)
    Bypassed,     // schedule bypassed by the plan
    ClosedToday,  // next session is on a later date
    MissedWindow, // now is at/after today's close
    Interrupted   // the pre-open wait was cancelled
};

inline const char* gate_outcome_to_string(GateOutcome outcome) {
    switch (outcome) {
    case GateOutcome::Open:
        return "open";
    case GateOutcome::Bypassed:
        return "bypassed";
    case GateOutcome::ClosedToday:
        return "closed today";
    case GateOutcome::MissedWindow:
        return "missed window";
    case GateOutcome::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

struct GateDecision {
    bool proceed = false;
    std::optional<TradingWindow> window;
    GateOutcome outcome = GateOutcome::ClosedToday;
    std::chrono::nanoseconds waited{0};
};

/**
 * Decides whether (and when) today's pipeline may start.
 *
 * The only pre-start blocking point of the system: a single sleep until
 * open + cool-down + buffer, never polled against the calendar again.
 */
class SessionGate {
public:
    SessionGate(broker::ICalendarSource& calendar, const config::PlanConfig& plan, util::Sleeper sleeper,
                logging::AsyncLogger& logger)
        : calendar_(calendar), plan_(plan), sleeper_(std::move(sleeper)), logger_(logger) {}

    GateDecision evaluate(Timestamp now, bool bypass) {
        const util::CivilDate today = util::eastern_date(now);

        if (bypass) {
            return bypass_decision(now, today);
        }

        GateDecision decision;
        std::optional<broker::CalendarDay> day = calendar_.session_for(today);
        if (!day) {
            MPT_LOGF_INFO(logger_, Session, "no session on the calendar from %s", util::format_date(today).c_str());
            decision.outcome = GateOutcome::ClosedToday;
            return decision;
        }

        if (day->date > today) {
            MPT_LOGF_INFO(logger_, Session, "market closed today, next session %s",
                          util::format_date(day->date).c_str());
            decision.outcome = GateOutcome::ClosedToday;
            return decision;
        }

        const TradingWindow& window = day->window;
        decision.window = window;
        if (now >= window.close) {
            MPT_LOGF_INFO(logger_, Session, "session closed at %s, nothing to do",
                          util::format_utc(window.close).c_str());
            decision.outcome = GateOutcome::MissedWindow;
            return decision;
        }

        const Timestamp start_at = window.open + plan_.market_cool_down_minutes * NS_PER_MINUTE;
        const Timestamp wait = start_at - now;
        if (wait > 0) {
            const auto sleep =
                std::chrono::nanoseconds(wait + plan_.market_open_buffer_seconds * NS_PER_SECOND);
            MPT_LOGF_INFO(logger_, Session, "waiting %lld s for market open at %s",
                          static_cast<long long>(sleep.count() / NS_PER_SECOND), util::format_utc(start_at).c_str());

            decision.waited = sleep;
            if (!sleeper_(sleep)) {
                MPT_LOG_WARN(logger_, Session, "wait for market open interrupted");
                decision.outcome = GateOutcome::Interrupted;
                return decision;
            }
        }

        decision.proceed = true;
        decision.outcome = GateOutcome::Open;
        return decision;
    }

private:
    broker::ICalendarSource& calendar_;
    const config::PlanConfig& plan_;
    util::Sleeper sleeper_;
    logging::AsyncLogger& logger_;

    GateDecision bypass_decision(Timestamp now, const util::CivilDate& today) {
        GateDecision decision;
        decision.proceed = true;
        decision.outcome = GateOutcome::Bypassed;

        try {
            std::optional<broker::CalendarDay> day = calendar_.session_for(today);
            if (day && day->date == today && now < day->window.close) {
                decision.window = day->window;
                decision.window->open = std::min(decision.window->open, now);
            }
        } catch (const broker::BrokerError& e) {
            MPT_LOGF_WARN(logger_, Session, "calendar unavailable under bypass: %s", e.what());
        }

        if (!decision.window) {
            decision.window = TradingWindow{now, now + plan_.bypass_session_minutes * NS_PER_MINUTE};
        }
        MPT_LOGF_WARN(logger_, Session, "market schedule bypassed, session until %s",
                      util::format_utc(decision.window->close).c_str());
        return decision;
    }
};

} // namespace session
} // namespace mpt
