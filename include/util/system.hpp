#pragma once

/**
 * System utilities for the session orchestrator
 *
 * Provides OS-level utilities for signal handling, host load sampling
 * and build identification. Linux-specific implementations.
 */

#include "cancellation.hpp"

#include <csignal>
#include <cstdlib>
#include <stdlib.h> // getloadavg
#include <thread>

#ifndef MPT_BUILD_LABEL
#define MPT_BUILD_LABEL "dev"
#endif

namespace mpt {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline CancellationToken* g_shutdown_token = nullptr;
} // namespace detail

/**
 * Shutdown signal handler.
 *
 * Only flips the installed token; logging happens on the thread that
 * observes the token.
 */
inline void shutdown_signal_handler(int sig) {
    if (detail::g_shutdown_token) {
        detail::g_shutdown_token->cancel(sig);
    }
}

/**
 * Install shutdown handler for SIGINT and SIGTERM.
 *
 * Forked workers call this again with their own token.
 *
 * @param token Token to cancel on signal (must outlive the handler)
 */
inline void install_shutdown_handler(CancellationToken& token) {
    detail::g_shutdown_token = &token;
    std::signal(SIGINT, shutdown_signal_handler);
    std::signal(SIGTERM, shutdown_signal_handler);
}

// ============================================================================
// Host Load
// ============================================================================

/**
 * Number of online CPUs, 0 when the platform cannot tell.
 */
inline int cpu_count() {
    return static_cast<int>(std::thread::hardware_concurrency());
}

/**
 * One-minute system load average, 0.0 when unavailable.
 *
 * This is host-wide load, not this process tree's load.
 */
inline double load_average() {
    double loads[1] = {0.0};
    if (getloadavg(loads, 1) < 1) {
        return 0.0;
    }
    return loads[0];
}

// ============================================================================
// Build identification
// ============================================================================

inline const char* build_label() {
    return MPT_BUILD_LABEL;
}

} // namespace util
} // namespace mpt
