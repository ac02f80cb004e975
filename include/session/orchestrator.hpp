#pragma once

#include "../broker/broker_api.hpp"
#include "../config/plan_config.hpp"
#include "../logging/async_logger.hpp"
#include "../process/process_topology.hpp"
#include "../types.hpp"
#include "../util/cancellation.hpp"
#include "instrument_universe.hpp"
#include "session_gate.hpp"
#include "symbol_partitioner.hpp"

#include <functional>
#include <random>
#include <string>

namespace mpt {
namespace session {

enum class RunStatus : uint8_t {
    ClosedToday,
    MissedWindow,
    InterruptedBeforeStart,
    Completed,
    Interrupted
};

inline const char* run_status_to_string(RunStatus status) {
    switch (status) {
    case RunStatus::ClosedToday:
        return "closed today";
    case RunStatus::MissedWindow:
        return "missed window";
    case RunStatus::InterruptedBeforeStart:
        return "interrupted before start";
    case RunStatus::Completed:
        return "completed";
    case RunStatus::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

struct RunOutcome {
    RunId run_id = 0;
    RunStatus status = RunStatus::ClosedToday;
    std::string end_reason;
    int worker_count = 0;      // 0 when no topology was built
    size_t universe_size = 0;
    size_t terminated = 0;     // handles force-stopped by the shutdown coordinator
};

/**
 * Everything the orchestrator talks to. Host sampling and clocks are
 * injectable so the whole run is testable in-process.
 */
struct OrchestratorDeps {
    broker::ICalendarSource& calendar;
    broker::IPositionSource& positions;
    broker::IHistoryLoader& history;
    process::IWorkerFactory& workers;
    IShardRandom& random;

    std::function<Timestamp()> clock;     // default: util::wall_clock_ns
    util::Sleeper sleeper;                // default: token sleep
    std::function<int()> cpu_count;       // default: util::cpu_count
    std::function<double()> load_average; // default: util::load_average
};

/**
 * One session run: gate -> universe -> warm-up -> worker count ->
 * partition -> topology -> wait (or interrupt and shut down).
 *
 * Nothing is spawned unless the gate proceeds. Broker failures before the
 * topology starts propagate to the caller.
 */
class SessionOrchestrator {
public:
    SessionOrchestrator(OrchestratorDeps deps, logging::AsyncLogger& logger);

    RunOutcome run(const config::PlanConfig& plan, RunId run_id, const util::CancellationToken& token);

    // OS-entropy run id, never 0
    static RunId generate_run_id() {
        std::random_device rd;
        RunId id = 0;
        while (id == 0) {
            id = (static_cast<RunId>(rd()) << 32) | static_cast<RunId>(rd());
        }
        return id;
    }

    /**
     * Positions (unless skipped) and watch symbols, warmed up; the final
     * universe is the positions plus every symbol warm-up returned.
     */
    InstrumentUniverse build_universe(const config::PlanConfig& plan, WarmUpResult& warm_up,
                                      const util::CancellationToken& token);

private:
    OrchestratorDeps deps_;
    logging::AsyncLogger& logger_;

    RunOutcome finish(RunOutcome outcome, RunStatus status);
};

} // namespace session
} // namespace mpt
