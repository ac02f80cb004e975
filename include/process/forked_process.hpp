#pragma once

#include "worker_handle.hpp"

#include <sys/types.h>

namespace mpt {
namespace process {

/**
 * IWorkerHandle backed by fork()
 *
 * The child installs its own SIGINT/SIGTERM handler and cancellation token,
 * starts its own logger (tag = log_tag), runs the entry and leaves through
 * _exit() so none of the parent's destructors (shared-memory owners, curl
 * handles) run in the child.
 *
 * The parent logger, if given, is drained and stopped around fork() so the
 * child never inherits a half-written ring buffer or a dead consumer thread.
 */
class ForkedProcess : public IWorkerHandle {
public:
    ForkedProcess(std::string name, std::string log_tag, WorkerEntry entry,
                  logging::AsyncLogger* parent_logger = nullptr);
    ~ForkedProcess() override;

    ForkedProcess(const ForkedProcess&) = delete;
    ForkedProcess& operator=(const ForkedProcess&) = delete;

    const std::string& name() const override { return name_; }
    void start() override;
    bool join(const util::CancellationToken& token) override;
    void terminate() override;
    bool started() const override { return pid_ > 0; }
    std::string describe_exit() const override;

    pid_t pid() const { return pid_; }
    bool exited() const override { return reaped_; }

    // Valid once exited(): exit code, or -signal when killed
    int exit_status() const { return exit_status_; }

private:
    std::string name_;
    std::string log_tag_;
    WorkerEntry entry_;
    logging::AsyncLogger* parent_logger_;

    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_status_ = 0;

    [[noreturn]] void run_child();
    void record_status(int status);
};

} // namespace process
} // namespace mpt
