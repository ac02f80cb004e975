#pragma once

#include "../ipc/message_queue.hpp"
#include "../process/process_topology.hpp"
#include "../process/worker_handle.hpp"
#include "../strategy/bar_strategy.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mpt {
namespace workers {

/**
 * Consumer process body
 *
 * Sole reader of its shard queue. Seeds each assigned symbol with its
 * warm-up history, then appends every bar it receives (history capped at
 * warm_up_bars) and hands it to each strategy. Stops on EndOfSession or
 * cancellation.
 */
class Consumer {
public:
    Consumer(process::ConsumerArgs args, std::vector<std::unique_ptr<strategy::IBarStrategy>> strategies,
             process::WorkerRuntime& runtime);

    int run();

    /**
     * Apply one queue message.
     * @return false once the session is over
     */
    bool handle(const ipc::QueueMessage& msg);

    void seed();
    void finish();

    const std::map<std::string, BarSeries>& history() const { return history_; }
    uint64_t bars_handled() const { return bars_handled_; }

private:
    process::ConsumerArgs args_;
    std::vector<std::unique_ptr<strategy::IBarStrategy>> strategies_;
    process::WorkerRuntime& rt_;

    std::map<std::string, BarSeries> history_;
    uint64_t bars_handled_ = 0;
    bool finished_ = false;

    void add_symbol(const std::string& symbol);
    size_t history_cap() const;
};

} // namespace workers
} // namespace mpt
