#include "../../include/workers/producer.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>
#include <chrono>

namespace mpt {
namespace workers {

Producer::Producer(process::ProducerArgs args, broker::IMarketFeed& feed, session::IShardRandom& random,
                   process::WorkerRuntime& runtime, std::function<Timestamp()> clock, util::Sleeper sleeper)
    : args_(std::move(args)), feed_(feed), random_(random), rt_(runtime), clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
    if (!clock_) {
        clock_ = [] { return util::wall_clock_ns(); };
    }
    if (!sleeper_) {
        sleeper_ = util::token_sleeper(rt_.token);
    }
}

int Producer::run() {
    open_queues();
    MPT_LOGF_INFO(rt_.logger, Shard, "producer: %zu symbols over %d shards until %s", args_.symbols.size(),
                  args_.worker_count, util::format_utc(args_.window_close).c_str());

    const auto interval = std::chrono::seconds(args_.plan.poll_interval_seconds);
    while (!rt_.token.cancelled() && clock_() < args_.window_close) {
        drain_scanner_feed();
        poll_once();
        if (!sleeper_(interval)) {
            break;
        }
    }

    end_session();
    MPT_LOGF_INFO(rt_.logger, Shard, "producer done: %llu bars forwarded",
                  static_cast<unsigned long long>(bars_forwarded_));
    return 0;
}

void Producer::open_queues() {
    if (!shard_queues_.empty()) {
        return;
    }
    for (const auto& name : args_.shard_queue_names) {
        shard_queues_.push_back(std::make_unique<ipc::MessageQueue>(name, false));
    }
    scanner_feed_ = std::make_unique<ipc::MessageQueue>(args_.scanner_feed_queue_name, false);
}

size_t Producer::drain_scanner_feed() {
    size_t adopted = 0;
    ipc::QueueMessage msg;
    while (scanner_feed_->pop(msg)) {
        if (msg.kind != ipc::MessageKind::NewSymbol) {
            continue;
        }
        const std::string symbol = msg.symbol_str();
        if (args_.shard_plan.shard_of(symbol) >= 0) {
            continue;
        }

        ShardId shard = args_.shard_plan.add_symbol(symbol, random_);
        args_.symbols.push_back(symbol);
        ++adopted;
        MPT_LOGF_INFO(rt_.logger, Shard, "new symbol %s -> shard %d", symbol.c_str(), shard);

        // Tell the owning consumer before any bar for it arrives; a stalled
        // consumer still adopts the symbol from its first bar
        if (!send(shard, ipc::QueueMessage::make_new_symbol(symbol, msg.timestamp)) && rt_.token.cancelled()) {
            break;
        }
    }
    return adopted;
}

size_t Producer::poll_once() {
    std::vector<std::pair<std::string, Bar>> bars;
    try {
        bars = feed_.latest_bars(args_.symbols);
    } catch (const broker::BrokerError& e) {
        MPT_LOGF_WARN(rt_.logger, Broker, "latest bars failed: %s", e.what());
        return 0;
    }

    size_t forwarded = 0;
    std::vector<bool> stalled(shard_queues_.size(), false);
    for (const auto& [symbol, bar] : bars) {
        ShardId shard = args_.shard_plan.shard_of(symbol);
        if (shard < 0 || stalled[static_cast<size_t>(shard)]) {
            continue;
        }
        auto it = last_sent_.find(symbol);
        if (it != last_sent_.end() && bar.timestamp <= it->second) {
            continue;
        }
        if (!send(shard, ipc::QueueMessage::make_bar(symbol, bar))) {
            if (rt_.token.cancelled()) {
                break;
            }
            // Unsent bars are retried on the next poll
            stalled[static_cast<size_t>(shard)] = true;
            continue;
        }
        last_sent_[symbol] = bar.timestamp;
        ++forwarded;
        ++bars_forwarded_;
    }
    return forwarded;
}

void Producer::end_session() {
    const auto msg = ipc::QueueMessage::make_end_of_session(clock_());
    const auto timeout = std::chrono::milliseconds(args_.send_timeout_ms);
    for (size_t shard = 0; shard < shard_queues_.size(); ++shard) {
        // Cancelled: consumers are being stopped too, never block here
        bool ok = rt_.token.cancelled() ? shard_queues_[shard]->push(msg)
                                        : shard_queues_[shard]->send(msg, rt_.token, timeout);
        if (!ok) {
            MPT_LOGF_WARN(rt_.logger, Shard, "could not deliver end of session to shard %zu", shard);
        }
    }
}

bool Producer::send(ShardId shard, const ipc::QueueMessage& msg) {
    auto& queue = *shard_queues_[static_cast<size_t>(shard)];
    if (rt_.token.cancelled()) {
        return queue.push(msg);
    }

    // Bounded per message and never past window close
    const Timestamp left = args_.window_close - clock_();
    auto timeout = std::chrono::milliseconds(0);
    if (left > 0) {
        timeout = std::min(std::chrono::milliseconds(args_.send_timeout_ms),
                           std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(left)));
    }
    if (queue.send(msg, rt_.token, timeout)) {
        return true;
    }
    if (!rt_.token.cancelled()) {
        MPT_LOGF_WARN(rt_.logger, Shard, "shard %d queue full, consumer not draining", shard);
    }
    return false;
}

} // namespace workers
} // namespace mpt
