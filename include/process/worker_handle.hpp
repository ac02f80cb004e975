#pragma once

#include "../logging/async_logger.hpp"
#include "../util/cancellation.hpp"

#include <functional>
#include <string>

namespace mpt {
namespace process {

/**
 * Capability handle to one spawned worker (producer, consumer, scanner).
 *
 * Owned exclusively by the topology. Implementations: ForkedProcess (OS
 * process) and in-memory fakes in tests.
 */
class IWorkerHandle {
public:
    virtual ~IWorkerHandle() = default;

    virtual const std::string& name() const = 0;

    virtual void start() = 0;

    /**
     * Block until the worker exits.
     * @return false if the token was cancelled first (worker still running)
     */
    virtual bool join(const util::CancellationToken& token) = 0;

    // Forceful stop, no drain. No-op if never started or already reaped.
    virtual void terminate() = 0;

    virtual bool started() const = 0;

    // True once the worker has been reaped (joined or terminated)
    virtual bool exited() const = 0;

    // Human readable exit status for logs ("exit 0", "signal 9", "running")
    virtual std::string describe_exit() const = 0;
};

/**
 * What a worker body gets inside its own process.
 */
struct WorkerRuntime {
    logging::AsyncLogger& logger;
    const util::CancellationToken& token;
};

// Worker body; the return value becomes the process exit code
using WorkerEntry = std::function<int(WorkerRuntime&)>;

} // namespace process
} // namespace mpt
