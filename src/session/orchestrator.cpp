#include "../../include/session/orchestrator.hpp"
#include "../../include/process/shutdown_coordinator.hpp"
#include "../../include/session/worker_count.hpp"
#include "../../include/util/string_utils.hpp"
#include "../../include/util/system.hpp"
#include "../../include/util/time_utils.hpp"

#include <memory>

namespace mpt {
namespace session {

SessionOrchestrator::SessionOrchestrator(OrchestratorDeps deps, logging::AsyncLogger& logger)
    : deps_(std::move(deps)), logger_(logger) {
    if (!deps_.clock) {
        deps_.clock = [] { return util::wall_clock_ns(); };
    }
    if (!deps_.cpu_count) {
        deps_.cpu_count = [] { return util::cpu_count(); };
    }
    if (!deps_.load_average) {
        deps_.load_average = [] { return util::load_average(); };
    }
}

RunOutcome SessionOrchestrator::run(const config::PlanConfig& plan, RunId run_id,
                                    const util::CancellationToken& token) {
    RunOutcome outcome;
    outcome.run_id = run_id;
    MPT_LOGF_INFO(logger_, Session, "run %s starting (%s)", run_id_to_string(run_id).c_str(),
                  config::trading_env_to_string(plan.env));

    // ========================================================================
    // Gate
    // ========================================================================
    util::Sleeper sleeper = deps_.sleeper ? deps_.sleeper : util::token_sleeper(token);
    SessionGate gate(deps_.calendar, plan, sleeper, logger_);
    GateDecision decision = gate.evaluate(deps_.clock(), plan.bypass_market_schedule);

    if (!decision.proceed) {
        switch (decision.outcome) {
        case GateOutcome::MissedWindow:
            return finish(outcome, RunStatus::MissedWindow);
        case GateOutcome::Interrupted:
            return finish(outcome, RunStatus::InterruptedBeforeStart);
        default:
            return finish(outcome, RunStatus::ClosedToday);
        }
    }
    if (token.cancelled()) {
        return finish(outcome, RunStatus::InterruptedBeforeStart);
    }
    const TradingWindow window = *decision.window;
    MPT_LOGF_INFO(logger_, Session, "trading window %s - %s (%s)", util::format_utc(window.open).c_str(),
                  util::format_utc(window.close).c_str(), gate_outcome_to_string(decision.outcome));

    // ========================================================================
    // Universe and warm-up
    // ========================================================================
    auto warm_up = std::make_shared<WarmUpResult>();
    InstrumentUniverse universe = build_universe(plan, *warm_up, token);
    outcome.universe_size = universe.size();
    if (token.cancelled()) {
        return finish(outcome, RunStatus::InterruptedBeforeStart);
    }

    // ========================================================================
    // Sizing and sharding
    // ========================================================================
    const int cpus = deps_.cpu_count();
    const double load = deps_.load_average();
    const int worker_count = estimate_worker_count(plan.num_consumers, cpus, load, plan.proc_factor);
    outcome.worker_count = worker_count;
    MPT_LOGF_INFO(logger_, Session, "worker count %d (configured %d, cpus %d, load %.2f, factor %.2f)",
                  worker_count, plan.num_consumers, cpus, load, plan.proc_factor);

    SymbolPartitioner partitioner(deps_.random);
    ShardPlan shards = partitioner.assign(universe.symbols(), worker_count);
    for (int shard = 0; shard < worker_count; ++shard) {
        const auto& symbols = shards.shard_symbols[static_cast<size_t>(shard)];
        MPT_LOGF_DEBUG(logger_, Shard, "shard %d: %zu symbols", shard, symbols.size());
    }

    // ========================================================================
    // Topology
    // ========================================================================
    process::ProcessTopology topology(deps_.workers, logger_);
    process::TopologyInputs inputs;
    inputs.run_id = run_id;
    inputs.universe = &universe;
    inputs.shard_plan = &shards;
    inputs.window = window;
    inputs.plan = &plan;
    inputs.warm_up = warm_up;
    inputs.scanners_only = plan.scanners_only;
    topology.build(inputs);

    process::ShutdownCoordinator shutdown(logger_);
    try {
        topology.start();
    } catch (const std::exception& e) {
        MPT_LOGF_ERROR(logger_, Process, "failed to start topology: %s", e.what());
        outcome.terminated = shutdown.terminate_all(topology.started_handles());
        throw;
    }

    if (topology.await_completion(token)) {
        return finish(outcome, RunStatus::Completed);
    }

    MPT_LOGF_WARN(logger_, Session, "interrupted (signal %d), terminating workers", token.signal_number());
    outcome.terminated = shutdown.terminate_all(topology.started_handles());
    return finish(outcome, RunStatus::Interrupted);
}

InstrumentUniverse SessionOrchestrator::build_universe(const config::PlanConfig& plan, WarmUpResult& warm_up,
                                                       const util::CancellationToken& token) {
    InstrumentUniverse positions;
    if (!plan.skip_existing) {
        for (const auto& pos : deps_.positions.list_open_positions()) {
            const std::string symbol = util::normalize_symbol(pos.symbol);
            if (!util::valid_symbol(symbol)) {
                MPT_LOGF_WARN(logger_, Broker, "position %s skipped: symbol longer than %zu characters",
                              symbol.c_str(), MAX_SYMBOL_LEN);
                continue;
            }
            positions.add(symbol);
        }
        MPT_LOGF_INFO(logger_, Session, "%zu open positions", positions.size());
    } else {
        MPT_LOG_INFO(logger_, Session, "skipping existing positions");
    }

    InstrumentUniverse candidates;
    candidates.add_all(positions.symbols());
    for (const auto& symbol : plan.watch_symbols) {
        if (util::valid_symbol(symbol)) {
            candidates.add(symbol);
        } else {
            MPT_LOGF_WARN(logger_, Session, "watch symbol %s skipped: too long", symbol.c_str());
        }
    }

    InstrumentUniverse universe;
    universe.add_all(positions.symbols());

    if (token.cancelled()) {
        universe.finalize();
        return universe;
    }

    if (plan.warm_up_bars > 0 && !candidates.empty()) {
        warm_up = deps_.history.warm_up(candidates.symbols(), plan.warm_up_bars, token);
        if (token.cancelled()) {
            universe.finalize();
            return universe;
        }
        for (const auto& symbol : candidates.symbols()) {
            if (warm_up.count(symbol)) {
                universe.add(symbol);
            } else if (!positions.contains(symbol)) {
                MPT_LOGF_WARN(logger_, Broker, "no warm-up history for %s, dropped", symbol.c_str());
            }
        }
        for (const auto& entry : warm_up) {
            universe.add(entry.first);
        }
    } else {
        universe.add_all(candidates.symbols());
    }

    universe.finalize();
    MPT_LOGF_INFO(logger_, Session, "instrument universe: %zu symbols", universe.size());
    return universe;
}

RunOutcome SessionOrchestrator::finish(RunOutcome outcome, RunStatus status) {
    outcome.status = status;
    outcome.end_reason = run_status_to_string(status);
    MPT_LOGF_INFO(logger_, Session, "run %s finished: %s", run_id_to_string(outcome.run_id).c_str(),
                  outcome.end_reason.c_str());
    return outcome;
}

} // namespace session
} // namespace mpt
