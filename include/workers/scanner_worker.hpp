#pragma once

#include "../ipc/message_queue.hpp"
#include "../process/process_topology.hpp"
#include "../process/worker_handle.hpp"
#include "../scanner/scanner.hpp"

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mpt {
namespace workers {

/**
 * Scanner process body
 *
 * Sole writer of the scanner feed. Waits for window open, then every
 * scan_interval runs each scanner and publishes symbols it has not
 * published before. Publishing never blocks: with no producer reading
 * (scanners-only mode) a full feed just drops with a warning.
 */
class ScannerWorker {
public:
    ScannerWorker(process::ScannerArgs args, std::vector<std::unique_ptr<scanner::IScanner>> scanners,
                  process::WorkerRuntime& runtime, std::function<Timestamp()> clock = {}, util::Sleeper sleeper = {});

    int run();

    void open_feed();

    /// @return number of symbols published by this pass
    size_t scan_once();

    const std::set<std::string>& published() const { return published_; }
    uint64_t passes() const { return passes_; }

private:
    process::ScannerArgs args_;
    std::vector<std::unique_ptr<scanner::IScanner>> scanners_;
    process::WorkerRuntime& rt_;
    std::function<Timestamp()> clock_;
    util::Sleeper sleeper_;

    std::unique_ptr<ipc::MessageQueue> feed_;
    std::set<std::string> published_;
    uint64_t passes_ = 0;
};

} // namespace workers
} // namespace mpt
