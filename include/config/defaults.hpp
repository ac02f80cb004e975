#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the session orchestrator.
 *
 * Every default used by PlanConfig, the workers and the CLI tools is
 * defined here so the plan loader and the tests agree on one value.
 *
 * Naming:
 * - _SECONDS / _MINUTES suffix: durations in that unit
 * - _BARS suffix: count of one-minute bars
 */

namespace mpt::config {

// =============================================================================
// Plan file location
// =============================================================================
namespace plan_file {
constexpr const char* DIR_ENV = "MPT_PLAN_DIR";
constexpr const char* FILE_ENV = "MPT_PLAN_FILE";
constexpr const char* DEFAULT_DIR = ".";
constexpr const char* DEFAULT_FILE = "tradeplan.json";
} // namespace plan_file

// =============================================================================
// Session gating
// =============================================================================
namespace session {
// Extra sleep after the computed wait so we never wake a hair before open
constexpr int MARKET_OPEN_BUFFER_SECONDS = 1;

// Minutes after open before the pipeline starts (0 = start at open)
constexpr int MARKET_COOL_DOWN_MINUTES = 0;

// Length of the synthesized window when the schedule is bypassed and the
// calendar has no session for today (regular US equity session)
constexpr int BYPASS_SESSION_MINUTES = 390;
} // namespace session

// =============================================================================
// Worker pool sizing
// =============================================================================
namespace workers {
// 0 = estimate from host load
constexpr int NUM_CONSUMERS = 0;

// Multiplier applied to the load-normalized cpu estimate
constexpr double PROC_FACTOR = 1.0;

// Upper bound on the estimate (tiny load averages would otherwise explode it)
constexpr int MAX_WORKER_COUNT = 512;
} // namespace workers

// =============================================================================
// Data and scanning cadence
// =============================================================================
namespace data {
constexpr int WARM_UP_BARS = 500;
constexpr int POLL_INTERVAL_SECONDS = 5;
constexpr int SCAN_INTERVAL_SECONDS = 60;
constexpr int MOST_ACTIVES_TOP = 20;
} // namespace data

// =============================================================================
// IPC
// =============================================================================
namespace ipc {
// Slots per shared-memory queue (power of 2)
constexpr size_t QUEUE_CAPACITY = 4096;

// Poll period of blocking queue/process waits; bounds interrupt latency
constexpr int WAIT_POLL_MS = 50;

// Longest the producer waits on one full shard queue before skipping it
constexpr int SEND_TIMEOUT_MS = 5000;
} // namespace ipc

// =============================================================================
// Backtest
// =============================================================================
namespace backtest {
constexpr const char* BATCH_DIR = "./batches";
} // namespace backtest

} // namespace mpt::config
