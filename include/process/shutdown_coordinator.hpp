#pragma once

#include "../logging/async_logger.hpp"
#include "worker_handle.hpp"

#include <set>
#include <vector>

namespace mpt {
namespace process {

/**
 * Force-stops every started worker after an interrupt.
 *
 * Each handle is terminated at most once; never-started and already
 * exited handles are skipped. No drain, no checkpoint. Termination errors
 * are logged and the remaining handles are still terminated.
 */
class ShutdownCoordinator {
public:
    explicit ShutdownCoordinator(logging::AsyncLogger& logger) : logger_(logger) {}

    /// @return number of still-running handles terminated by this call
    size_t terminate_all(const std::vector<IWorkerHandle*>& handles) {
        size_t count = 0;
        for (IWorkerHandle* handle : handles) {
            if (!handle || !handle->started() || terminated_.count(handle)) {
                continue;
            }
            terminated_.insert(handle);
            if (handle->exited()) {
                MPT_LOGF_DEBUG(logger_, Process, "%s already gone (%s)", handle->name().c_str(),
                               handle->describe_exit().c_str());
                continue;
            }

            try {
                handle->terminate();
                ++count;
                MPT_LOGF_WARN(logger_, Process, "terminated %s (%s)", handle->name().c_str(),
                              handle->describe_exit().c_str());
            } catch (const std::exception& e) {
                MPT_LOGF_ERROR(logger_, Process, "failed to terminate %s: %s", handle->name().c_str(), e.what());
            }
        }
        return count;
    }

    size_t terminated_count() const { return terminated_.size(); }

private:
    logging::AsyncLogger& logger_;
    std::set<IWorkerHandle*> terminated_;
};

} // namespace process
} // namespace mpt
