#include "../../include/workers/forked_worker_factory.hpp"
#include "../../include/scanner/scanner_factory.hpp"
#include "../../include/strategy/strategy_factory.hpp"
#include "../../include/workers/consumer.hpp"
#include "../../include/workers/producer.hpp"
#include "../../include/workers/scanner_worker.hpp"

namespace mpt {
namespace workers {

namespace {

std::string worker_tag(RunId run_id, const std::string& role) {
    return run_id_to_string(run_id) + ":" + role;
}

} // namespace

std::unique_ptr<process::IWorkerHandle> ForkedWorkerFactory::make_consumer(const process::ConsumerArgs& args) {
    const std::string name = "consumer-" + std::to_string(args.shard);
    return std::make_unique<process::ForkedProcess>(
        name, worker_tag(args.run_id, name),
        [args](process::WorkerRuntime& rt) {
            Consumer consumer(args, strategy::StrategyFactory::create_all(args.plan.strategies, rt.logger), rt);
            return consumer.run();
        },
        &parent_logger_);
}

std::unique_ptr<process::IWorkerHandle> ForkedWorkerFactory::make_producer(const process::ProducerArgs& args) {
    return std::make_unique<process::ForkedProcess>(
        "producer", worker_tag(args.run_id, "producer"),
        [args, make_feed = make_feed_](process::WorkerRuntime& rt) {
            std::unique_ptr<broker::IMarketFeed> feed = make_feed();
            session::SystemShardRandom random;
            Producer producer(args, *feed, random, rt);
            return producer.run();
        },
        &parent_logger_);
}

std::unique_ptr<process::IWorkerHandle> ForkedWorkerFactory::make_scanner(const process::ScannerArgs& args) {
    return std::make_unique<process::ForkedProcess>(
        "scanner", worker_tag(args.run_id, "scanner"),
        [args, make_screener = make_screener_](process::WorkerRuntime& rt) {
            std::unique_ptr<broker::IScreener> screener = make_screener();
            ScannerWorker worker(args, scanner::ScannerFactory::create_all(args.plan.scanners, *screener), rt);
            return worker.run();
        },
        &parent_logger_);
}

} // namespace workers
} // namespace mpt
