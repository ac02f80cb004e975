/**
 * Batch Backtest Driver
 *
 * Replays recorded minute-bar batches through the trading plan's strategies.
 *
 * Usage:
 *   ./mpt_backtest -b                          # list batches
 *   ./mpt_backtest [-s] [-d SYM]... BATCH_ID... # replay in order
 *
 * Exit status: 0 on success and on bad options (usage printed), 1 when a
 * batch fails to replay.
 */

#include "../include/backtest/batch_replay.hpp"
#include "../include/config/plan_config.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/util/cli.hpp"

#include <iostream>

using namespace mpt;
using namespace mpt::util;

int main(int argc, char* argv[]) {
    BacktestArgs args;
    if (!parse_backtest_args(argc, argv, args)) {
        print_backtest_help(std::cerr);
        return 0;
    }

    if (args.help) {
        print_backtest_help();
        return 0;
    }

    logging::AsyncLogger logger("backtest");
    logger.start();

    config::PlanConfig plan;
    try {
        plan = config::PlanLoader::load(config::PlanLoader::path_from_env());
    } catch (const config::ConfigError& e) {
        MPT_LOGF_ERROR(logger, Backtest, "nothing to do: %s", e.what());
        logger.stop();
        return 0;
    }

    int rc = 0;
    try {
        if (args.list_batches) {
            for (const auto& id : backtest::list_batches(plan.backtest_dir)) {
                std::cout << id << "\n";
            }
        } else if (args.batch_ids.empty()) {
            std::cout << "No batch ids given.\n";
            print_backtest_help();
        } else {
            backtest::BatchReplayer replayer(plan, logger);
            uint64_t total_bars = 0;
            for (const auto& id : args.batch_ids) {
                backtest::ReplaySummary summary = replayer.replay(id, args.debug_symbols, args.strict);
                total_bars += summary.bars;
            }
            std::cout << "\n[DONE] " << args.batch_ids.size() << " batches | " << total_bars << " bars\n";
        }
    } catch (const config::ConfigError& e) {
        MPT_LOGF_ERROR(logger, Backtest, "nothing to do: %s", e.what());
    } catch (const std::exception& e) {
        MPT_LOGF_ERROR(logger, Backtest, "backtest failed: %s", e.what());
        rc = 1;
    }

    logger.stop();
    return rc;
}
