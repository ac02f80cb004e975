#include "../../include/workers/consumer.hpp"

#include <algorithm>
#include <chrono>

namespace mpt {
namespace workers {

Consumer::Consumer(process::ConsumerArgs args, std::vector<std::unique_ptr<strategy::IBarStrategy>> strategies,
                   process::WorkerRuntime& runtime)
    : args_(std::move(args)), strategies_(std::move(strategies)), rt_(runtime) {}

int Consumer::run() {
    ipc::MessageQueue queue(args_.queue_name, false);
    seed();

    if (args_.symbols.empty()) {
        MPT_LOGF_INFO(rt_.logger, Shard, "consumer %d idle: no symbols assigned", args_.shard);
    } else {
        MPT_LOGF_INFO(rt_.logger, Shard, "consumer %d: %zu symbols", args_.shard, args_.symbols.size());
    }

    const auto timeout = std::chrono::milliseconds(config::ipc::WAIT_POLL_MS * 10);
    ipc::QueueMessage msg;
    while (!rt_.token.cancelled()) {
        if (!queue.receive(msg, rt_.token, timeout)) {
            continue;
        }
        if (!handle(msg)) {
            break;
        }
    }

    finish();
    MPT_LOGF_INFO(rt_.logger, Shard, "consumer %d done: %llu bars", args_.shard,
                  static_cast<unsigned long long>(bars_handled_));
    return 0;
}

void Consumer::seed() {
    for (const auto& symbol : args_.symbols) {
        add_symbol(symbol);
    }
}

bool Consumer::handle(const ipc::QueueMessage& msg) {
    switch (msg.kind) {
    case ipc::MessageKind::EndOfSession:
        return false;

    case ipc::MessageKind::NewSymbol:
        add_symbol(msg.symbol_str());
        return true;

    case ipc::MessageKind::Bar: {
        const std::string symbol = msg.symbol_str();
        if (!history_.count(symbol)) {
            add_symbol(symbol);
        }

        BarSeries& series = history_[symbol];
        const Bar bar = msg.bar();
        series.push_back(bar);
        const size_t cap = history_cap();
        if (series.size() > cap) {
            series.erase(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(series.size() - cap));
        }

        ++bars_handled_;
        for (auto& s : strategies_) {
            s->on_bar(symbol, bar, series);
        }
        return true;
    }
    }
    return true;
}

void Consumer::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    for (auto& s : strategies_) {
        s->on_session_end();
    }
}

void Consumer::add_symbol(const std::string& symbol) {
    if (symbol.empty() || history_.count(symbol)) {
        return;
    }

    BarSeries seeded;
    if (args_.warm_up) {
        auto it = args_.warm_up->find(symbol);
        if (it != args_.warm_up->end()) {
            seeded = it->second;
        }
    }
    const size_t cap = history_cap();
    if (seeded.size() > cap) {
        seeded.erase(seeded.begin(), seeded.begin() + static_cast<std::ptrdiff_t>(seeded.size() - cap));
    }

    auto& series = history_.emplace(symbol, std::move(seeded)).first->second;
    for (auto& s : strategies_) {
        s->on_symbol(symbol, series);
    }
}

size_t Consumer::history_cap() const {
    // warm_up_bars == 0 still keeps the live bar being handled
    return static_cast<size_t>(std::max(1, args_.plan.warm_up_bars));
}

} // namespace workers
} // namespace mpt
