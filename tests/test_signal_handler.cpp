#include <cassert>
#include <iostream>
#include <csignal>

#include "../include/util/system.hpp"

using namespace mpt::util;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

TEST(test_install_leaves_token_untouched) {
    CancellationToken token;
    install_shutdown_handler(token);

    ASSERT_FALSE(token.cancelled());
    ASSERT_TRUE(token.signal_number() == 0);
}

TEST(test_sigint_cancels_token) {
    CancellationToken token;
    install_shutdown_handler(token);

    std::raise(SIGINT);

    ASSERT_TRUE(token.cancelled());
    ASSERT_TRUE(token.signal_number() == SIGINT);
}

TEST(test_sigterm_cancels_token) {
    CancellationToken token;
    install_shutdown_handler(token);

    std::raise(SIGTERM);

    ASSERT_TRUE(token.cancelled());
    ASSERT_TRUE(token.signal_number() == SIGTERM);
}

TEST(test_reinstall_targets_new_token) {
    CancellationToken first;
    CancellationToken second;
    install_shutdown_handler(first);
    install_shutdown_handler(second);

    std::raise(SIGINT);

    ASSERT_FALSE(first.cancelled());
    ASSERT_TRUE(second.cancelled());
}

TEST(test_cancelled_token_cuts_sleep_short) {
    CancellationToken token;
    ASSERT_TRUE(token.sleep_for(std::chrono::milliseconds(1)));

    token.cancel();
    ASSERT_FALSE(token.sleep_for(std::chrono::hours(1)));
    ASSERT_TRUE(token.signal_number() == 0);
}

TEST(test_host_sampling) {
    ASSERT_TRUE(cpu_count() >= 0);
    ASSERT_TRUE(load_average() >= 0.0);
    ASSERT_TRUE(build_label() != nullptr);
}

int main() {
    std::cout << "=== Signal Handler Tests ===\n";
    RUN_TEST(test_install_leaves_token_untouched);
    RUN_TEST(test_sigint_cancels_token);
    RUN_TEST(test_sigterm_cancels_token);
    RUN_TEST(test_reinstall_targets_new_token);
    RUN_TEST(test_cancelled_token_cuts_sleep_short);
    RUN_TEST(test_host_sampling);
    std::cout << "All tests passed!\n";
    return 0;
}
