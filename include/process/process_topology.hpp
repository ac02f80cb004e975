#pragma once

#include "../config/plan_config.hpp"
#include "../ipc/message_queue.hpp"
#include "../logging/async_logger.hpp"
#include "../session/instrument_universe.hpp"
#include "../session/symbol_partitioner.hpp"
#include "../types.hpp"
#include "worker_handle.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mpt {
namespace process {

// ============================================================================
// Spawn arguments, handed by value into each worker
// ============================================================================

struct ConsumerArgs {
    RunId run_id = 0;
    ShardId shard = 0;
    std::string queue_name;
    std::vector<std::string> symbols; // empty = idle shard
    std::shared_ptr<const WarmUpResult> warm_up;
    config::PlanConfig plan;
};

struct ProducerArgs {
    RunId run_id = 0;
    std::vector<std::string> shard_queue_names; // index = shard id
    std::vector<std::string> symbols;
    session::ShardPlan shard_plan;
    Timestamp window_close = 0;
    config::PlanConfig plan;
    std::string scanner_feed_queue_name;
    int worker_count = 0;
    int send_timeout_ms = config::ipc::SEND_TIMEOUT_MS; // per message, per shard
};

struct ScannerArgs {
    RunId run_id = 0;
    config::PlanConfig plan;
    Timestamp window_open = 0;
    Timestamp window_close = 0;
    std::string scanner_feed_queue_name;
};

/**
 * Creates (unstarted) worker handles. The OS implementation forks; tests
 * return in-memory fakes.
 */
class IWorkerFactory {
public:
    virtual ~IWorkerFactory() = default;

    virtual std::unique_ptr<IWorkerHandle> make_consumer(const ConsumerArgs& args) = 0;
    virtual std::unique_ptr<IWorkerHandle> make_producer(const ProducerArgs& args) = 0;
    virtual std::unique_ptr<IWorkerHandle> make_scanner(const ScannerArgs& args) = 0;
};

struct TopologyInputs {
    RunId run_id = 0;
    const session::InstrumentUniverse* universe = nullptr;
    const session::ShardPlan* shard_plan = nullptr;
    TradingWindow window;
    const config::PlanConfig* plan = nullptr;
    std::shared_ptr<const WarmUpResult> warm_up;
    bool scanners_only = false;
};

/**
 * Process pipeline for one session run
 *
 * Construction order: shard queues -> scanner-feed queue -> consumers ->
 * producer -> scanner. Queues are owned (and unlinked) by the topology;
 * workers open them by name. In scanners-only mode neither consumers nor
 * the producer are built.
 */
class ProcessTopology {
public:
    ProcessTopology(IWorkerFactory& factory, logging::AsyncLogger& logger);

    ProcessTopology(const ProcessTopology&) = delete;
    ProcessTopology& operator=(const ProcessTopology&) = delete;

    void build(const TopologyInputs& inputs);

    // Scanner always; consumers and producer unless scanners-only
    void start();

    /**
     * Join producer, then scanner, then each consumer in shard order.
     * @return false as soon as a join is interrupted by the token
     */
    bool await_completion(const util::CancellationToken& token);

    // Handles that were actually started, in start order
    std::vector<IWorkerHandle*> started_handles() const;

    bool built() const { return built_; }
    bool scanners_only() const { return scanners_only_; }

    IWorkerHandle* producer() const { return producer_.get(); }
    IWorkerHandle* scanner() const { return scanner_.get(); }
    const std::vector<std::unique_ptr<IWorkerHandle>>& consumers() const { return consumers_; }

    const std::vector<std::unique_ptr<ipc::MessageQueue>>& shard_queues() const { return shard_queues_; }
    ipc::MessageQueue* scanner_feed() const { return scanner_feed_.get(); }

private:
    IWorkerFactory& factory_;
    logging::AsyncLogger& logger_;

    bool built_ = false;
    bool scanners_only_ = false;

    std::vector<std::unique_ptr<ipc::MessageQueue>> shard_queues_;
    std::unique_ptr<ipc::MessageQueue> scanner_feed_;

    std::vector<std::unique_ptr<IWorkerHandle>> consumers_;
    std::unique_ptr<IWorkerHandle> producer_;
    std::unique_ptr<IWorkerHandle> scanner_;
    std::vector<IWorkerHandle*> started_;

    void start_one(IWorkerHandle& handle);
    bool join_one(IWorkerHandle& handle, const util::CancellationToken& token);
};

} // namespace process
} // namespace mpt
