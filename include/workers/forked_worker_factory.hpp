#pragma once

#include "../broker/broker_api.hpp"
#include "../process/forked_process.hpp"
#include "../process/process_topology.hpp"

#include <functional>
#include <memory>

namespace mpt {
namespace workers {

/**
 * IWorkerFactory that forks one OS process per worker.
 *
 * Broker clients are built inside the child (after fork) through the
 * supplied factories, so no socket or curl handle crosses the fork.
 */
class ForkedWorkerFactory : public process::IWorkerFactory {
public:
    using FeedFactory = std::function<std::unique_ptr<broker::IMarketFeed>()>;
    using ScreenerFactory = std::function<std::unique_ptr<broker::IScreener>()>;

    ForkedWorkerFactory(FeedFactory make_feed, ScreenerFactory make_screener, logging::AsyncLogger& parent_logger)
        : make_feed_(std::move(make_feed)), make_screener_(std::move(make_screener)), parent_logger_(parent_logger) {}

    std::unique_ptr<process::IWorkerHandle> make_consumer(const process::ConsumerArgs& args) override;
    std::unique_ptr<process::IWorkerHandle> make_producer(const process::ProducerArgs& args) override;
    std::unique_ptr<process::IWorkerHandle> make_scanner(const process::ScannerArgs& args) override;

private:
    FeedFactory make_feed_;
    ScreenerFactory make_screener_;
    logging::AsyncLogger& parent_logger_;
};

} // namespace workers
} // namespace mpt
