#include "../../include/process/forked_process.hpp"
#include "../../include/util/system.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace mpt {
namespace process {

ForkedProcess::ForkedProcess(std::string name, std::string log_tag, WorkerEntry entry,
                             logging::AsyncLogger* parent_logger)
    : name_(std::move(name)), log_tag_(std::move(log_tag)), entry_(std::move(entry)), parent_logger_(parent_logger) {}

ForkedProcess::~ForkedProcess() {
    // Never leave a zombie or an orphan behind
    if (started() && !reaped_) {
        kill(pid_, SIGKILL);
        while (waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
        }
    }
}

void ForkedProcess::start() {
    if (started()) {
        throw std::logic_error("worker " + name_ + " already started");
    }

    const bool restart_logger = parent_logger_ && parent_logger_->running();
    if (restart_logger) {
        parent_logger_->stop();
    }

    std::fflush(nullptr); // children must not replay buffered parent output
    pid_t pid = fork();
    if (pid == 0) {
        run_child();
    }

    if (restart_logger) {
        parent_logger_->start();
    }

    if (pid < 0) {
        throw std::runtime_error("fork failed for " + name_ + ": " + std::strerror(errno));
    }
    pid_ = pid;

    if (parent_logger_) {
        MPT_LOGF_INFO(*parent_logger_, Process, "started %s (pid %d)", name_.c_str(), static_cast<int>(pid_));
    }
}

void ForkedProcess::run_child() {
    util::CancellationToken token;
    util::install_shutdown_handler(token);

    int code = 1;
    {
        logging::AsyncLogger logger(log_tag_);
        if (parent_logger_) {
            logger.set_min_level(parent_logger_->min_level());
        }
        logger.start();

        WorkerRuntime runtime{logger, token};
        try {
            code = entry_(runtime);
        } catch (const std::exception& e) {
            MPT_LOGF_ERROR(logger, Process, "%s failed: %s", name_.c_str(), e.what());
            code = 1;
        }

        if (token.cancelled()) {
            MPT_LOGF_INFO(logger, Process, "%s stopped by signal %d", name_.c_str(), token.signal_number());
        }
        logger.stop();
    }
    std::fflush(nullptr);
    _exit(code);
}

bool ForkedProcess::join(const util::CancellationToken& token) {
    if (!started() || reaped_) {
        return true;
    }

    const auto poll = std::chrono::milliseconds(config::ipc::WAIT_POLL_MS);
    while (true) {
        int status = 0;
        pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            record_status(status);
            return true;
        }
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                // Reaped elsewhere; nothing left to wait for
                reaped_ = true;
                return true;
            }
            throw std::runtime_error("waitpid failed for " + name_ + ": " + std::strerror(errno));
        }
        if (!token.sleep_for(poll)) {
            return false;
        }
    }
}

void ForkedProcess::terminate() {
    if (!started() || reaped_) {
        return;
    }

    if (kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        throw std::runtime_error("kill failed for " + name_ + ": " + std::strerror(errno));
    }

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        record_status(status);
    } else {
        reaped_ = true;
    }
}

std::string ForkedProcess::describe_exit() const {
    if (!started()) {
        return "not started";
    }
    if (!reaped_) {
        return "running";
    }
    if (exit_status_ < 0) {
        return "signal " + std::to_string(-exit_status_);
    }
    return "exit " + std::to_string(exit_status_);
}

void ForkedProcess::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = -WTERMSIG(status);
    }
}

} // namespace process
} // namespace mpt
