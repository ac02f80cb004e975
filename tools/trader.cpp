/**
 * Session Trader
 *
 * One trading session: waits for the market window, builds the instrument
 * universe, forks the producer / consumer / scanner pipeline and supervises
 * it until close or Ctrl+C.
 *
 * Usage:
 *   MPT_PLAN_DIR=/etc/mpt MPT_PLAN_FILE=tradeplan.json ./mpt_trader
 *
 * Environment:
 *   MPT_PLAN_DIR, MPT_PLAN_FILE   trading plan location (default ./tradeplan.json)
 *   MPT_LOG_LEVEL                 trace|debug|info|warn|error (default info)
 *   APCA_API_KEY_ID, APCA_API_SECRET_KEY, APCA_API_BASE_URL, APCA_DATA_BASE_URL
 *
 * Exit status: 0 on completion and on any plan problem, 1 on runtime failure.
 */

#include "../include/broker/alpaca_rest.hpp"
#include "../include/config/plan_config.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/scanner/scanner_factory.hpp"
#include "../include/session/orchestrator.hpp"
#include "../include/strategy/strategy_factory.hpp"
#include "../include/util/string_utils.hpp"
#include "../include/util/system.hpp"
#include "../include/workers/forked_worker_factory.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

using namespace mpt;

namespace {

void print_banner(const std::string& plan_path, const config::PlanConfig& plan, RunId run_id) {
    std::vector<std::string> scanners, strategies;
    for (const auto& s : plan.scanners)
        scanners.push_back(s.name);
    for (const auto& s : plan.strategies)
        strategies.push_back(s.name);

    std::cout << "\nMulti-Process Session Trader " << util::build_label() << " - "
              << config::trading_env_to_string(plan.env) << "\n";
    std::cout << "================================================================\n";
    std::cout << "  run:        " << run_id_to_string(run_id) << "\n";
    std::cout << "  plan:       " << plan_path << "\n";
    std::cout << "  schedule:   " << (plan.bypass_market_schedule ? "BYPASSED" : "exchange calendar") << "\n";
    std::cout << "  mode:       " << (plan.scanners_only ? "scanners only" : "full pipeline") << "\n";
    std::cout << "  scanners:   " << util::join(scanners, ", ") << "\n";
    std::cout << "  strategies: " << util::join(strategies, ", ") << "\n";
    std::cout << "================================================================\n\n";
}

} // namespace

int main() {
    util::CancellationToken token;
    util::install_shutdown_handler(token);

    const RunId run_id = session::SessionOrchestrator::generate_run_id();
    logging::AsyncLogger logger(run_id_to_string(run_id) + ":orchestrator");
    if (const char* level = std::getenv("MPT_LOG_LEVEL"); level && *level) {
        logger.set_min_level(logging::level_from_string(level));
    }
    logger.start();

    const std::string plan_path = config::PlanLoader::path_from_env();
    config::PlanConfig plan;
    try {
        plan = config::PlanLoader::load(plan_path);
        strategy::StrategyFactory::validate(plan.strategies);
        scanner::ScannerFactory::validate(plan.scanners);
    } catch (const config::ConfigError& e) {
        MPT_LOGF_ERROR(logger, Session, "nothing to do: %s", e.what());
        logger.stop();
        return 0;
    }

    print_banner(plan_path, plan, run_id);

    const broker::AlpacaSettings settings = broker::AlpacaSettings::from_env(plan.env);
    if (!settings.has_credentials()) {
        MPT_LOG_WARN(logger, Broker, "APCA_API_KEY_ID / APCA_API_SECRET_KEY not set");
    }

    int rc = 0;
    try {
        broker::AlpacaRest rest(settings);
        workers::ForkedWorkerFactory factory([settings] { return std::make_unique<broker::AlpacaRest>(settings); },
                                             [settings] { return std::make_unique<broker::AlpacaRest>(settings); },
                                             logger);
        session::SystemShardRandom random;

        session::OrchestratorDeps deps{rest, rest, rest, factory, random};
        session::SessionOrchestrator orchestrator(std::move(deps), logger);

        session::RunOutcome outcome = orchestrator.run(plan, run_id, token);
        std::cout << "\n[DONE] run " << run_id_to_string(outcome.run_id) << " | " << outcome.end_reason << " | "
                  << outcome.worker_count << " workers | " << outcome.universe_size << " symbols\n";
    } catch (const config::ConfigError& e) {
        MPT_LOGF_ERROR(logger, Session, "nothing to do: %s", e.what());
    } catch (const std::exception& e) {
        MPT_LOGF_ERROR(logger, Session, "run %s failed: %s", run_id_to_string(run_id).c_str(), e.what());
        rc = 1;
    }

    logger.stop();
    return rc;
}
