#include "../../include/process/process_topology.hpp"

#include <stdexcept>

namespace mpt {
namespace process {

ProcessTopology::ProcessTopology(IWorkerFactory& factory, logging::AsyncLogger& logger)
    : factory_(factory), logger_(logger) {}

void ProcessTopology::build(const TopologyInputs& in) {
    if (built_) {
        throw std::logic_error("process topology already built");
    }
    if (!in.universe || !in.shard_plan || !in.plan) {
        throw std::invalid_argument("process topology needs universe, shard plan and plan");
    }
    if (in.shard_plan->worker_count() < 1) {
        throw std::invalid_argument("process topology needs at least one shard");
    }

    const session::ShardPlan& shards = *in.shard_plan;
    const int worker_count = shards.worker_count();
    scanners_only_ = in.scanners_only;

    // 1. One queue per shard, always
    std::vector<std::string> queue_names;
    for (ShardId shard = 0; shard < worker_count; ++shard) {
        queue_names.push_back(ipc::shard_queue_name(in.run_id, shard));
        shard_queues_.push_back(std::make_unique<ipc::MessageQueue>(queue_names.back(), true));
    }

    // 2. Scanner feed, always
    const std::string feed_name = ipc::scanner_feed_queue_name(in.run_id);
    scanner_feed_ = std::make_unique<ipc::MessageQueue>(feed_name, true);

    if (!scanners_only_) {
        // 3. Consumers, each bound to its own shard queue
        for (ShardId shard = 0; shard < worker_count; ++shard) {
            ConsumerArgs args;
            args.run_id = in.run_id;
            args.shard = shard;
            args.queue_name = queue_names[static_cast<size_t>(shard)];
            args.symbols = shards.shard_symbols[static_cast<size_t>(shard)];
            args.warm_up = in.warm_up;
            args.plan = *in.plan;
            consumers_.push_back(factory_.make_consumer(args));
        }

        // 4. Producer, fanning out to every shard queue
        ProducerArgs args;
        args.run_id = in.run_id;
        args.shard_queue_names = queue_names;
        args.symbols = in.universe->symbols();
        args.shard_plan = shards;
        args.window_close = in.window.close;
        args.plan = *in.plan;
        args.scanner_feed_queue_name = feed_name;
        args.worker_count = worker_count;
        producer_ = factory_.make_producer(args);
    }

    // 5. Scanner
    ScannerArgs args;
    args.run_id = in.run_id;
    args.plan = *in.plan;
    args.window_open = in.window.open;
    args.window_close = in.window.close;
    args.scanner_feed_queue_name = feed_name;
    scanner_ = factory_.make_scanner(args);

    built_ = true;
    MPT_LOGF_INFO(logger_, Process, "topology built: %d shard queues, %zu consumers, producer %s, scanner",
                  worker_count, consumers_.size(), producer_ ? "yes" : "no");
}

void ProcessTopology::start() {
    if (!built_) {
        throw std::logic_error("process topology not built");
    }

    if (!scanners_only_) {
        for (auto& consumer : consumers_) {
            start_one(*consumer);
        }
        start_one(*producer_);
    } else {
        MPT_LOG_INFO(logger_, Process, "scanners-only mode: producer and consumers not started");
    }
    start_one(*scanner_);
}

bool ProcessTopology::await_completion(const util::CancellationToken& token) {
    if (producer_ && producer_->started() && !join_one(*producer_, token)) {
        return false;
    }
    if (scanner_ && scanner_->started() && !join_one(*scanner_, token)) {
        return false;
    }
    for (auto& consumer : consumers_) {
        if (consumer->started() && !join_one(*consumer, token)) {
            return false;
        }
    }
    return true;
}

std::vector<IWorkerHandle*> ProcessTopology::started_handles() const {
    return started_;
}

void ProcessTopology::start_one(IWorkerHandle& handle) {
    handle.start();
    started_.push_back(&handle);
}

bool ProcessTopology::join_one(IWorkerHandle& handle, const util::CancellationToken& token) {
    if (!handle.join(token)) {
        return false;
    }
    MPT_LOGF_INFO(logger_, Process, "%s finished (%s)", handle.name().c_str(), handle.describe_exit().c_str());
    return true;
}

} // namespace process
} // namespace mpt
