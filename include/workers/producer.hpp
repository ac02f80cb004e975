#pragma once

#include "../broker/broker_api.hpp"
#include "../ipc/message_queue.hpp"
#include "../process/process_topology.hpp"
#include "../process/worker_handle.hpp"
#include "../session/symbol_partitioner.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mpt {
namespace workers {

/**
 * Producer process body
 *
 * Sole writer of every shard queue. Until window close (or cancellation):
 * adopt symbols published by the scanner (random shard), poll the latest
 * minute bar of every tracked symbol, forward bars newer than the last one
 * sent, sleep poll_interval. Then send EndOfSession to every shard.
 *
 * A full shard queue is waited on for at most send_timeout_ms (and never
 * past window close), then skipped for the rest of that poll, so a dead
 * consumer cannot stall the other shards or the end of the session.
 */
class Producer {
public:
    Producer(process::ProducerArgs args, broker::IMarketFeed& feed, session::IShardRandom& random,
             process::WorkerRuntime& runtime, std::function<Timestamp()> clock = {}, util::Sleeper sleeper = {});

    int run();

    // Steps of one loop iteration, public for tests
    void open_queues();
    size_t drain_scanner_feed();
    size_t poll_once();
    void end_session();

    const session::ShardPlan& shard_plan() const { return args_.shard_plan; }
    const std::vector<std::string>& symbols() const { return args_.symbols; }
    uint64_t bars_forwarded() const { return bars_forwarded_; }

private:
    process::ProducerArgs args_;
    broker::IMarketFeed& feed_;
    session::IShardRandom& random_;
    process::WorkerRuntime& rt_;
    std::function<Timestamp()> clock_;
    util::Sleeper sleeper_;

    std::vector<std::unique_ptr<ipc::MessageQueue>> shard_queues_;
    std::unique_ptr<ipc::MessageQueue> scanner_feed_;
    std::map<std::string, Timestamp> last_sent_;
    uint64_t bars_forwarded_ = 0;

    bool send(ShardId shard, const ipc::QueueMessage& msg);
};

} // namespace workers
} // namespace mpt
