#pragma once

/**
 * In-memory collaborators shared by the orchestration tests.
 */

#include "../include/broker/broker_api.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/process/process_topology.hpp"
#include "../include/process/worker_handle.hpp"
#include "../include/session/symbol_partitioner.hpp"
#include "../include/util/time_utils.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpt {
namespace testing {

// Logger that swallows output; entries are still counted
inline void silence(logging::AsyncLogger& logger) {
    logger.set_output_callback([](const logging::LogEntry&) {});
}

// 2024-03-15 (a Friday, EDT) at hh:mm New York time
inline Timestamp ny_time(int hour, int minute, util::CivilDate date = {2024, 3, 15}) {
    return util::eastern_to_utc_ns(date, hour, minute);
}

// ============================================================================
// Broker fakes
// ============================================================================

class FakeCalendar : public broker::ICalendarSource {
public:
    std::optional<broker::CalendarDay> day;
    bool fail = false;
    int calls = 0;

    static FakeCalendar regular_session(util::CivilDate date) {
        FakeCalendar cal;
        broker::CalendarDay d;
        d.date = date;
        d.window.open = util::eastern_to_utc_ns(date, 9, 30);
        d.window.close = util::eastern_to_utc_ns(date, 16, 0);
        cal.day = d;
        return cal;
    }

    std::optional<broker::CalendarDay> session_for(const util::CivilDate&) override {
        ++calls;
        if (fail) {
            throw broker::BrokerError("calendar down");
        }
        return day;
    }
};

class FakePositions : public broker::IPositionSource {
public:
    std::vector<broker::OpenPosition> positions;
    int calls = 0;
    std::function<void()> on_list;

    std::vector<broker::OpenPosition> list_open_positions() override {
        ++calls;
        if (on_list) {
            on_list();
        }
        return positions;
    }
};

/**
 * Returns `bars_per_symbol` synthetic bars for every requested symbol not
 * listed in `missing`.
 */
class FakeHistory : public broker::IHistoryLoader {
public:
    std::vector<std::string> missing;
    size_t bars_per_symbol = 3;
    std::vector<std::string> requested;
    int requested_max = -1;
    std::function<void(const util::CancellationToken&)> on_warm_up;

    WarmUpResult warm_up(const std::vector<std::string>& symbols, int max_count,
                         const util::CancellationToken& token) override {
        requested = symbols;
        requested_max = max_count;
        if (on_warm_up) {
            on_warm_up(token);
        }
        WarmUpResult out;
        for (const auto& s : symbols) {
            if (std::find(missing.begin(), missing.end(), s) != missing.end()) {
                continue;
            }
            BarSeries series;
            for (size_t i = 0; i < bars_per_symbol; ++i) {
                Bar b;
                b.timestamp = static_cast<Timestamp>(i + 1) * NS_PER_MINUTE;
                b.open = b.high = b.low = b.close = 100.0 + static_cast<double>(i);
                b.volume = 10;
                series.push_back(b);
            }
            out.emplace(s, std::move(series));
        }
        return out;
    }
};

class FakeFeed : public broker::IMarketFeed {
public:
    std::vector<std::pair<std::string, Bar>> next;
    bool fail = false;
    std::vector<std::vector<std::string>> requests;

    std::vector<std::pair<std::string, Bar>> latest_bars(const std::vector<std::string>& symbols) override {
        requests.push_back(symbols);
        if (fail) {
            throw broker::BrokerError("feed down");
        }
        return next;
    }
};

class FakeScreener : public broker::IScreener {
public:
    std::vector<std::string> symbols;
    int last_top = 0;

    std::vector<std::string> most_actives(int top) override {
        last_top = top;
        return symbols;
    }
};

/**
 * Replays a fixed sequence of shard ids (cycling).
 */
class SequenceShardRandom : public session::IShardRandom {
public:
    explicit SequenceShardRandom(std::vector<ShardId> seq) : seq_(std::move(seq)) {}

    ShardId next_shard(int bound) override {
        bounds.push_back(bound);
        ShardId s = seq_[pos_++ % seq_.size()];
        return s;
    }

    std::vector<int> bounds;

private:
    std::vector<ShardId> seq_;
    size_t pos_ = 0;
};

// ============================================================================
// Worker fakes
// ============================================================================

// Call counters kept outside the handle so they survive the topology
struct HandleStats {
    int start = 0;
    int join = 0;
    int terminate = 0;
};

/**
 * Records every call; join behaviour is scriptable.
 */
class FakeWorkerHandle : public process::IWorkerHandle {
public:
    using JoinFn = std::function<bool(const util::CancellationToken&)>;

    FakeWorkerHandle(std::string name, HandleStats& stats, std::vector<std::string>* events = nullptr)
        : name_(std::move(name)), stats_(stats), events_(events) {}

    const std::string& name() const override { return name_; }

    void start() override {
        ++stats_.start;
        record("start " + name_);
        if (fail_start) {
            throw std::runtime_error("cannot start " + name_);
        }
        started_ = true;
    }

    bool join(const util::CancellationToken& token) override {
        ++stats_.join;
        record("join " + name_);
        if (on_join) {
            return on_join(token);
        }
        exited_ = true;
        return true;
    }

    void terminate() override {
        ++stats_.terminate;
        record("terminate " + name_);
        exited_ = true;
    }

    bool started() const override { return started_; }
    bool exited() const override { return exited_; }

    std::string describe_exit() const override {
        if (!started_)
            return "not started";
        return exited_ ? "exit 0" : "running";
    }

    bool fail_start = false;
    JoinFn on_join;

private:
    std::string name_;
    HandleStats& stats_;
    std::vector<std::string>* events_;
    bool started_ = false;
    bool exited_ = false;

    void record(const std::string& e) {
        if (events_) {
            events_->push_back(e);
        }
    }
};

/**
 * Hands out FakeWorkerHandles. Handle pointers are only valid while the
 * topology that owns them is alive; stats and events outlive it.
 */
class FakeWorkerFactory : public process::IWorkerFactory {
public:
    std::vector<std::string> events;
    std::map<std::string, HandleStats> stats;

    std::vector<process::ConsumerArgs> consumer_args;
    std::vector<process::ProducerArgs> producer_args;
    std::vector<process::ScannerArgs> scanner_args;

    std::vector<FakeWorkerHandle*> consumers;
    FakeWorkerHandle* producer = nullptr;
    FakeWorkerHandle* scanner = nullptr;

    // Called on every handle right after creation (to script joins)
    std::function<void(FakeWorkerHandle&)> on_create;

    std::unique_ptr<process::IWorkerHandle> make_consumer(const process::ConsumerArgs& args) override {
        consumer_args.push_back(args);
        auto h = make("consumer-" + std::to_string(args.shard));
        consumers.push_back(h.get());
        return h;
    }

    std::unique_ptr<process::IWorkerHandle> make_producer(const process::ProducerArgs& args) override {
        producer_args.push_back(args);
        auto h = make("producer");
        producer = h.get();
        return h;
    }

    std::unique_ptr<process::IWorkerHandle> make_scanner(const process::ScannerArgs& args) override {
        scanner_args.push_back(args);
        auto h = make("scanner");
        scanner = h.get();
        return h;
    }

    int total_terminates() const {
        int n = 0;
        for (const auto& [name, s] : stats)
            n += s.terminate;
        return n;
    }

private:
    std::unique_ptr<FakeWorkerHandle> make(const std::string& name) {
        events.push_back("make " + name);
        auto h = std::make_unique<FakeWorkerHandle>(name, stats[name], &events);
        if (on_create) {
            on_create(*h);
        }
        return h;
    }
};

} // namespace testing
} // namespace mpt
