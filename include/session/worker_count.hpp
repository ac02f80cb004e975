#pragma once

#include "../config/defaults.hpp"

#include <algorithm>
#include <cmath>

namespace mpt {
namespace session {

/**
 * Number of consumer processes for this run.
 *
 * A positive configured count wins. Otherwise scale the CPU count by the
 * host load (clamped to at most 1.0, so a lightly loaded host gets more
 * workers than cores) and by proc_factor, rounding up.
 *
 * @param configured   num_consumers from the plan (0 = estimate)
 * @param cpu_count    online CPUs, <= 0 when unknown
 * @param load_average 1-minute load, <= 0 or NaN when unknown
 * @param proc_factor  plan multiplier
 * @return worker count in [1, MAX_WORKER_COUNT]
 */
inline int estimate_worker_count(int configured, int cpu_count, double load_average, double proc_factor) {
    if (configured > 0) {
        return configured;
    }

    if (!std::isfinite(load_average) || load_average <= 0.0) {
        load_average = 1.0;
    }
    const double divisor = std::min(load_average, 1.0);

    double estimate = 0.0;
    if (cpu_count > 0) {
        estimate = static_cast<double>(cpu_count) / divisor * proc_factor;
    } else {
        estimate = proc_factor / divisor;
    }

    if (!std::isfinite(estimate)) {
        return config::workers::MAX_WORKER_COUNT;
    }
    estimate = std::ceil(estimate);
    estimate = std::clamp(estimate, 1.0, static_cast<double>(config::workers::MAX_WORKER_COUNT));
    return static_cast<int>(estimate);
}

} // namespace session
} // namespace mpt
