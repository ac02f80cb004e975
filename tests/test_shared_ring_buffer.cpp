#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "../include/ipc/message_queue.hpp"
#include "../include/ipc/shared_ring_buffer.hpp"

using namespace mpt;
using namespace mpt::ipc;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

constexpr const char* TEST_SHM_NAME = "/mpt_ring_buffer_test";

struct Small {
    uint64_t value;
};

TEST(ring_create_and_empty) {
    SharedRingBuffer<Small, 8> ring(TEST_SHM_NAME, true);
    ASSERT_TRUE(ring.empty());
    ASSERT_FALSE(ring.full());
    ASSERT_EQ(ring.capacity(), 8u);
    ASSERT_EQ(ring.name(), std::string(TEST_SHM_NAME));

    Small s{};
    ASSERT_FALSE(ring.pop(s));
}

TEST(ring_fifo_order) {
    SharedRingBuffer<Small, 8> ring(TEST_SHM_NAME, true);
    for (uint64_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(ring.push(Small{i}));
    }
    ASSERT_EQ(ring.size(), 5u);

    for (uint64_t i = 0; i < 5; ++i) {
        Small s{};
        ASSERT_TRUE(ring.pop(s));
        ASSERT_EQ(s.value, i);
    }
    ASSERT_EQ(ring.total_produced(), 5u);
    ASSERT_EQ(ring.total_consumed(), 5u);
}

TEST(ring_full_rejects_push) {
    SharedRingBuffer<Small, 4> ring(TEST_SHM_NAME, true);
    for (uint64_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(ring.push(Small{i}));
    }
    ASSERT_TRUE(ring.full());
    ASSERT_FALSE(ring.push(Small{99}));

    // Wraps around after a pop
    Small s{};
    ASSERT_TRUE(ring.pop(s));
    ASSERT_TRUE(ring.push(Small{4}));
    for (uint64_t expected = 1; expected <= 4; ++expected) {
        ASSERT_TRUE(ring.pop(s));
        ASSERT_EQ(s.value, expected);
    }
}

TEST(ring_open_existing) {
    SharedRingBuffer<Small, 8> owner(TEST_SHM_NAME, true);
    owner.push(Small{42});

    SharedRingBuffer<Small, 8> client(TEST_SHM_NAME, false);
    Small s{};
    ASSERT_TRUE(client.pop(s));
    ASSERT_EQ(s.value, 42u);
    ASSERT_TRUE(owner.empty());
}

TEST(ring_open_missing_throws) {
    bool threw = false;
    try {
        SharedRingBuffer<Small, 8> client("/mpt_ring_buffer_missing", false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(ring_layout_mismatch_detected) {
    SharedRingBuffer<Small, 8> owner(TEST_SHM_NAME, true);

    bool threw = false;
    try {
        SharedRingBuffer<Small, 16> wrong(TEST_SHM_NAME, false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(ring_owner_unlinks) {
    {
        SharedRingBuffer<Small, 8> owner(TEST_SHM_NAME, true);
    }
    bool threw = false;
    try {
        SharedRingBuffer<Small, 8> client(TEST_SHM_NAME, false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(ring_receive_times_out) {
    SharedRingBuffer<Small, 8> ring(TEST_SHM_NAME, true);
    util::CancellationToken token;
    Small s{};

    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(ring.receive(s, token, std::chrono::milliseconds(20)));
    ASSERT_TRUE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));

    ring.push(Small{7});
    ASSERT_TRUE(ring.receive(s, token, std::chrono::milliseconds(20)));
    ASSERT_EQ(s.value, 7u);
}

TEST(ring_send_gives_up_when_cancelled) {
    SharedRingBuffer<Small, 2> ring(TEST_SHM_NAME, true);
    util::CancellationToken token;
    const auto forever = std::chrono::hours(1);
    ASSERT_TRUE(ring.send(Small{1}, token, forever));
    ASSERT_TRUE(ring.send(Small{2}, token, forever));

    token.cancel();
    ASSERT_FALSE(ring.send(Small{3}, token, forever));
    ASSERT_EQ(ring.size(), 2u);
}

TEST(ring_send_times_out_without_reader) {
    SharedRingBuffer<Small, 2> ring(TEST_SHM_NAME, true);
    util::CancellationToken token;
    ring.push(Small{1});
    ring.push(Small{2});

    const auto t0 = std::chrono::steady_clock::now();
    ASSERT_FALSE(ring.send(Small{3}, token, std::chrono::milliseconds(20)));
    ASSERT_TRUE(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(20));
    ASSERT_FALSE(ring.send(Small{3}, token, std::chrono::milliseconds(0)));
    ASSERT_EQ(ring.size(), 2u);
}

TEST(ring_send_waits_for_reader) {
    SharedRingBuffer<Small, 2> ring(TEST_SHM_NAME, true);
    util::CancellationToken token;
    ring.push(Small{1});
    ring.push(Small{2});

    std::thread reader([&ring] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        Small s{};
        ring.pop(s);
    });
    ASSERT_TRUE(ring.send(Small{3}, token, std::chrono::seconds(10)));
    reader.join();
    ASSERT_EQ(ring.size(), 2u);
}

TEST(queue_message_fields) {
    Bar b{60 * NS_PER_SECOND, 1.0, 2.0, 0.5, 1.5, 1000};
    QueueMessage m = QueueMessage::make_bar("aapl_long_symbol_name", b);
    ASSERT_TRUE(m.kind == MessageKind::Bar);
    ASSERT_EQ(m.symbol_str().size(), MAX_SYMBOL_LEN); // truncated
    ASSERT_EQ(m.bar().high, 2.0);
    ASSERT_EQ(m.bar().volume, 1000u);

    QueueMessage e = QueueMessage::make_end_of_session(5);
    ASSERT_TRUE(e.kind == MessageKind::EndOfSession);
    ASSERT_TRUE(e.symbol_str().empty());
    ASSERT_EQ(std::string(message_kind_to_string(MessageKind::NewSymbol)), std::string("new_symbol"));
}

TEST(queue_names_are_run_scoped) {
    const RunId a = 0x1234;
    const RunId b = 0x1235;
    ASSERT_EQ(shard_queue_name(a, 3), std::string("/mpt_0000000000001234_q3"));
    ASSERT_EQ(scanner_feed_queue_name(a), std::string("/mpt_0000000000001234_scan"));
    ASSERT_TRUE(shard_queue_name(a, 0) != shard_queue_name(b, 0));
}

int main() {
    std::cout << "\n=== Shared Ring Buffer Tests ===\n\n";

    RUN_TEST(ring_create_and_empty);
    RUN_TEST(ring_fifo_order);
    RUN_TEST(ring_full_rejects_push);
    RUN_TEST(ring_open_existing);
    RUN_TEST(ring_open_missing_throws);
    RUN_TEST(ring_layout_mismatch_detected);
    RUN_TEST(ring_owner_unlinks);
    RUN_TEST(ring_receive_times_out);
    RUN_TEST(ring_send_gives_up_when_cancelled);
    RUN_TEST(ring_send_times_out_without_reader);
    RUN_TEST(ring_send_waits_for_reader);
    RUN_TEST(queue_message_fields);
    RUN_TEST(queue_names_are_run_scoped);

    std::cout << "\n=== All Shared Ring Buffer Tests Passed! ===\n";
    return 0;
}
