#pragma once

/**
 * Cooperative cancellation for the orchestrator and its workers.
 *
 * One token per process. The SIGINT/SIGTERM handler flips it (see
 * util/system.hpp); every blocking call in the system (session gate wait,
 * process joins, queue send/receive) polls it and returns promptly.
 */

#include "../config/defaults.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace mpt {
namespace util {

class CancellationToken {
public:
    CancellationToken() = default;

    // Non-copyable: handlers hold a pointer to the live token
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * Request cancellation. Async-signal-safe (lock-free atomic store).
     */
    void cancel(int signal_number = 0) {
        signal_.store(signal_number, std::memory_order_relaxed);
        cancelled_.store(true, std::memory_order_release);
    }

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Signal that triggered cancellation (0 if cancelled programmatically)
    int signal_number() const { return signal_.load(std::memory_order_relaxed); }

    /**
     * Sleep for the given duration in short slices, watching the token.
     *
     * @return true if the full duration elapsed, false if cancelled first
     */
    bool sleep_for(std::chrono::nanoseconds duration) const {
        const auto slice = std::chrono::milliseconds(config::ipc::WAIT_POLL_MS);
        const auto deadline = std::chrono::steady_clock::now() + duration;

        while (!cancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - now);
            std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(remaining, slice));
        }
        return false;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int> signal_{0};
};

/**
 * Blocking sleep observing cancellation, injectable for tests.
 * @return true if the full duration elapsed, false if interrupted
 */
using Sleeper = std::function<bool(std::chrono::nanoseconds)>;

inline Sleeper token_sleeper(const CancellationToken& token) {
    return [&token](std::chrono::nanoseconds d) { return token.sleep_for(d); };
}

} // namespace util
} // namespace mpt
