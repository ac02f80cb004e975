#include "../../include/workers/scanner_worker.hpp"
#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

#include <chrono>

namespace mpt {
namespace workers {

ScannerWorker::ScannerWorker(process::ScannerArgs args, std::vector<std::unique_ptr<scanner::IScanner>> scanners,
                             process::WorkerRuntime& runtime, std::function<Timestamp()> clock, util::Sleeper sleeper)
    : args_(std::move(args)), scanners_(std::move(scanners)), rt_(runtime), clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
    if (!clock_) {
        clock_ = [] { return util::wall_clock_ns(); };
    }
    if (!sleeper_) {
        sleeper_ = util::token_sleeper(rt_.token);
    }
}

int ScannerWorker::run() {
    open_feed();

    const Timestamp now = clock_();
    if (now < args_.window_open) {
        MPT_LOGF_INFO(rt_.logger, Scanner, "scanner waiting for open at %s",
                      util::format_utc(args_.window_open).c_str());
        if (!sleeper_(std::chrono::nanoseconds(args_.window_open - now))) {
            return 0;
        }
    }

    MPT_LOGF_INFO(rt_.logger, Scanner, "scanner: %zu scanners every %d s until %s", scanners_.size(),
                  args_.plan.scan_interval_seconds, util::format_utc(args_.window_close).c_str());

    const auto interval = std::chrono::seconds(args_.plan.scan_interval_seconds);
    while (!rt_.token.cancelled() && clock_() < args_.window_close) {
        scan_once();
        if (!sleeper_(interval)) {
            break;
        }
    }

    MPT_LOGF_INFO(rt_.logger, Scanner, "scanner done: %llu passes, %zu symbols published",
                  static_cast<unsigned long long>(passes_), published_.size());
    return 0;
}

void ScannerWorker::open_feed() {
    if (!feed_) {
        feed_ = std::make_unique<ipc::MessageQueue>(args_.scanner_feed_queue_name, false);
    }
}

size_t ScannerWorker::scan_once() {
    ++passes_;
    size_t published = 0;
    const Timestamp now = clock_();

    for (auto& s : scanners_) {
        std::vector<std::string> found;
        try {
            found = s->scan();
        } catch (const broker::BrokerError& e) {
            MPT_LOGF_WARN(rt_.logger, Scanner, "%s scan failed: %s", s->name(), e.what());
            continue;
        }

        for (const auto& raw : found) {
            const std::string symbol = util::normalize_symbol(raw);
            if (!util::valid_symbol(symbol) || published_.count(symbol)) {
                continue;
            }
            if (!feed_->push(ipc::QueueMessage::make_new_symbol(symbol, now))) {
                // Retried on the next pass
                MPT_LOGF_WARN(rt_.logger, Scanner, "scanner feed full, dropping %s", symbol.c_str());
                continue;
            }
            published_.insert(symbol);
            ++published;
            MPT_LOGF_DEBUG(rt_.logger, Scanner, "%s found %s", s->name(), symbol.c_str());
        }
    }
    return published;
}

} // namespace workers
} // namespace mpt
