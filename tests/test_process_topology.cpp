#include <cassert>
#include <iostream>
#include <stdexcept>

#include "../include/process/process_topology.hpp"
#include "../include/session/orchestrator.hpp"
#include "fakes.hpp"

using namespace mpt;
using namespace mpt::process;
using namespace mpt::testing;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

/**
 * Universe + shard plan + plan for a topology under test.
 */
struct Fixture {
    config::PlanConfig plan;
    session::InstrumentUniverse universe;
    session::ShardPlan shards;
    TopologyInputs inputs;

    Fixture(std::vector<std::string> symbols, std::vector<ShardId> draws, int workers, bool scanners_only = false) {
        universe.add_all(symbols);
        universe.finalize();

        SequenceShardRandom random(draws.empty() ? std::vector<ShardId>{0} : draws);
        session::SymbolPartitioner partitioner(random);
        shards = partitioner.assign(universe.symbols(), workers);

        plan.scanners_only = scanners_only;

        inputs.run_id = session::SessionOrchestrator::generate_run_id();
        inputs.universe = &universe;
        inputs.shard_plan = &shards;
        inputs.window = TradingWindow{ny_time(9, 30), ny_time(16, 0)};
        inputs.plan = &plan;
        inputs.warm_up = std::make_shared<WarmUpResult>();
        inputs.scanners_only = scanners_only;
    }
};

TEST(full_topology_construction_order) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA", "BBB", "CCC"}, {1, 0, 1}, 3);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);

    ASSERT_EQ(factory.events, (std::vector<std::string>{"make consumer-0", "make consumer-1", "make consumer-2",
                                                        "make producer", "make scanner"}));
    ASSERT_EQ(topology.shard_queues().size(), 3u);
    ASSERT_TRUE(topology.scanner_feed() != nullptr);
    ASSERT_EQ(topology.consumers().size(), 3u);
    ASSERT_TRUE(topology.producer() != nullptr);
    ASSERT_TRUE(topology.scanner() != nullptr);
}

TEST(consumers_get_their_shard_only) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA", "BBB", "CCC"}, {1, 0, 1}, 3);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);

    ASSERT_EQ(factory.consumer_args.size(), 3u);
    const auto& c0 = factory.consumer_args[0];
    const auto& c1 = factory.consumer_args[1];
    const auto& c2 = factory.consumer_args[2];
    ASSERT_EQ(c0.symbols, (std::vector<std::string>{"BBB"}));
    ASSERT_EQ(c1.symbols, (std::vector<std::string>{"AAA", "CCC"}));
    ASSERT_TRUE(c2.symbols.empty()); // idle shard still gets a consumer
    ASSERT_EQ(c0.queue_name, ipc::shard_queue_name(fx.inputs.run_id, 0));
    ASSERT_EQ(c2.queue_name, ipc::shard_queue_name(fx.inputs.run_id, 2));
    ASSERT_EQ(c1.run_id, fx.inputs.run_id);
    ASSERT_EQ(c1.warm_up, fx.inputs.warm_up);
}

TEST(producer_gets_everything) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA", "BBB", "CCC"}, {1, 0, 1}, 2);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);

    ASSERT_EQ(factory.producer_args.size(), 1u);
    const ProducerArgs& p = factory.producer_args[0];
    ASSERT_EQ(p.run_id, fx.inputs.run_id);
    ASSERT_EQ(p.worker_count, 2);
    ASSERT_EQ(p.shard_queue_names.size(), 2u);
    ASSERT_EQ(p.shard_queue_names[1], ipc::shard_queue_name(fx.inputs.run_id, 1));
    ASSERT_EQ(p.symbols, (std::vector<std::string>{"AAA", "BBB", "CCC"}));
    ASSERT_EQ(p.shard_plan.shard_of("AAA"), 1);
    ASSERT_EQ(p.shard_plan.shard_of("BBB"), 0);
    ASSERT_EQ(p.window_close, fx.inputs.window.close);
    ASSERT_EQ(p.scanner_feed_queue_name, ipc::scanner_feed_queue_name(fx.inputs.run_id));

    ASSERT_EQ(factory.scanner_args.size(), 1u);
    const ScannerArgs& s = factory.scanner_args[0];
    ASSERT_EQ(s.window_open, fx.inputs.window.open);
    ASSERT_EQ(s.window_close, fx.inputs.window.close);
    ASSERT_EQ(s.scanner_feed_queue_name, p.scanner_feed_queue_name);
}

TEST(scanners_only_builds_scanner_alone) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA", "BBB"}, {0, 1}, 2, true);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);

    ASSERT_EQ(factory.events, (std::vector<std::string>{"make scanner"}));
    ASSERT_TRUE(factory.producer_args.empty());
    ASSERT_TRUE(factory.consumer_args.empty());
    ASSERT_TRUE(topology.producer() == nullptr);
    ASSERT_TRUE(topology.consumers().empty());

    // Queues are still created; the scanner is bound to a live feed
    ASSERT_EQ(topology.shard_queues().size(), 2u);
    ASSERT_TRUE(topology.scanner_feed() != nullptr);
    ipc::MessageQueue feed(factory.scanner_args[0].scanner_feed_queue_name, false);
    ASSERT_TRUE(feed.push(ipc::QueueMessage::make_new_symbol("XYZ", 1)));
    ASSERT_EQ(topology.scanner_feed()->size(), 1u);

    topology.start();
    ASSERT_EQ(factory.stats["scanner"].start, 1);
    ASSERT_EQ(topology.started_handles().size(), 1u);

    ASSERT_TRUE(topology.await_completion(util::CancellationToken()));
    ASSERT_EQ(factory.stats["scanner"].join, 1);
}

TEST(start_launches_everyone_once) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA"}, {0}, 2);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);
    topology.start();

    ASSERT_EQ(factory.stats["consumer-0"].start, 1);
    ASSERT_EQ(factory.stats["consumer-1"].start, 1);
    ASSERT_EQ(factory.stats["producer"].start, 1);
    ASSERT_EQ(factory.stats["scanner"].start, 1);
    ASSERT_EQ(topology.started_handles().size(), 4u);
}

TEST(await_joins_producer_scanner_then_consumers) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA", "BBB"}, {0, 1}, 2);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);
    topology.start();
    factory.events.clear();

    util::CancellationToken token;
    ASSERT_TRUE(topology.await_completion(token));
    ASSERT_EQ(factory.events,
              (std::vector<std::string>{"join producer", "join scanner", "join consumer-0", "join consumer-1"}));
}

TEST(await_stops_at_interrupted_join) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    factory.on_create = [](FakeWorkerHandle& h) {
        if (h.name() == "scanner") {
            h.on_join = [](const util::CancellationToken&) { return false; };
        }
    };
    Fixture fx({"AAA"}, {0}, 1);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);
    topology.start();

    ASSERT_FALSE(topology.await_completion(util::CancellationToken()));
    ASSERT_EQ(factory.stats["producer"].join, 1);
    ASSERT_EQ(factory.stats["scanner"].join, 1);
    ASSERT_EQ(factory.stats["consumer-0"].join, 0);
}

TEST(build_twice_rejected) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    Fixture fx({"AAA"}, {0}, 1);

    ProcessTopology topology(factory, logger);
    topology.build(fx.inputs);

    bool threw = false;
    try {
        topology.build(fx.inputs);
    } catch (const std::logic_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(start_before_build_rejected) {
    logging::AsyncLogger logger;
    silence(logger);
    FakeWorkerFactory factory;
    ProcessTopology topology(factory, logger);

    bool threw = false;
    try {
        topology.start();
    } catch (const std::logic_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "\n=== Process Topology Tests ===\n\n";

    RUN_TEST(full_topology_construction_order);
    RUN_TEST(consumers_get_their_shard_only);
    RUN_TEST(producer_gets_everything);
    RUN_TEST(scanners_only_builds_scanner_alone);
    RUN_TEST(start_launches_everyone_once);
    RUN_TEST(await_joins_producer_scanner_then_consumers);
    RUN_TEST(await_stops_at_interrupted_join);
    RUN_TEST(build_twice_rejected);
    RUN_TEST(start_before_build_rejected);

    std::cout << "\n=== All Process Topology Tests Passed! ===\n";
    return 0;
}
