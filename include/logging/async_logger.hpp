#pragma once

#include "../util/time_utils.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

namespace mpt {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

/**
 * Parse "trace".."fatal" (case-sensitive lower). Unknown names map to Info.
 */
inline LogLevel level_from_string(const std::string& s) {
    if (s == "trace")
        return LogLevel::Trace;
    if (s == "debug")
        return LogLevel::Debug;
    if (s == "warn")
        return LogLevel::Warn;
    if (s == "error")
        return LogLevel::Error;
    if (s == "fatal")
        return LogLevel::Fatal;
    return LogLevel::Info;
}

// Category constants for the orchestrator and its workers
namespace LogCategory {
constexpr uint8_t Session = 0;
constexpr uint8_t Process = 1;
constexpr uint8_t Broker = 2;
constexpr uint8_t Shard = 3;
constexpr uint8_t Scanner = 4;
constexpr uint8_t Strategy = 5;
constexpr uint8_t Backtest = 6;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::Session:
        return "session";
    case LogCategory::Process:
        return "process";
    case LogCategory::Broker:
        return "broker";
    case LogCategory::Shard:
        return "shard";
    case LogCategory::Scanner:
        return "scanner";
    case LogCategory::Strategy:
        return "strategy";
    case LogCategory::Backtest:
        return "backtest";
    default:
        return "misc";
    }
}

/**
 * Log Entry - Fixed size for predictable latency
 */
struct alignas(64) LogEntry {
    int64_t timestamp_ns; // 8 bytes (wall clock)
    LogLevel level;       // 1 byte
    uint8_t category;     // 1 byte
    uint16_t reserved;    // 2 bytes padding
    uint32_t thread_id;   // 4 bytes
    char message[240];    // 240 bytes (null-terminated)
    // Total: 256 bytes (four cache lines)

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Lock-Free SPSC Ring Buffer
 *
 * Single Producer, Single Consumer - no locks needed.
 * Cache-line aligned to prevent false sharing.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) { std::memset(buffer_.data(), 0, sizeof(buffer_)); }

    /**
     * Try to push a log entry (producer side)
     * Returns true if successful, false if buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    /**
     * Try to pop a log entry (consumer side)
     * Returns true if entry was available, false if empty.
     */
    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * The log call only formats into a fixed-size entry and pushes it to a
 * lock-free ring; a background thread does the I/O.
 *
 * Every logger carries a tag (run id and process role) that the default
 * sink prints with each line, so interleaved output from the orchestrator
 * and its forked workers can be told apart.
 *
 * Fork rules: a thread does not survive fork(). Stop the parent's logger
 * before forking and start it again afterwards; the child builds its own.
 *
 * Usage:
 *   AsyncLogger logger("3fa2c1d4e5f60718:orchestrator");
 *   logger.start();
 *   MPT_LOGF_INFO(logger, Session, "worker count %d", n);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    explicit AsyncLogger(std::string tag = "")
        : tag_(std::move(tag)), running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (!running_.exchange(false))
            return; // Already stopped

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }

        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    bool running() const { return running_.load(); }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry;
        entry.timestamp_ns = util::wall_clock_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    const std::string& tag() const { return tag_; }
    void set_tag(std::string tag) { tag_ = std::move(tag); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    std::string tag_;
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    LogLevel min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            const std::string ts = util::format_utc(entry.timestamp_ns);
            const auto ms = (entry.timestamp_ns / NS_PER_MS) % 1000;
            std::fprintf(stderr, "[%s %03lld] [%s] [%s] [%s] %s\n", ts.c_str(), static_cast<long long>(ms),
                         level_to_string(entry.level), category_to_string(entry.category), tag_.c_str(),
                         entry.message);
        }
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Convenience macros
#define MPT_LOG_TRACE(logger, cat, msg) (logger).log(mpt::logging::LogLevel::Trace, mpt::logging::LogCategory::cat, msg)
#define MPT_LOG_DEBUG(logger, cat, msg) (logger).log(mpt::logging::LogLevel::Debug, mpt::logging::LogCategory::cat, msg)
#define MPT_LOG_INFO(logger, cat, msg) (logger).log(mpt::logging::LogLevel::Info, mpt::logging::LogCategory::cat, msg)
#define MPT_LOG_WARN(logger, cat, msg) (logger).log(mpt::logging::LogLevel::Warn, mpt::logging::LogCategory::cat, msg)
#define MPT_LOG_ERROR(logger, cat, msg) (logger).log(mpt::logging::LogLevel::Error, mpt::logging::LogCategory::cat, msg)

// Printf-style variants
#define MPT_LOGF_DEBUG(logger, cat, fmt, ...)                                                                          \
    (logger).logf(mpt::logging::LogLevel::Debug, mpt::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define MPT_LOGF_INFO(logger, cat, fmt, ...)                                                                           \
    (logger).logf(mpt::logging::LogLevel::Info, mpt::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define MPT_LOGF_WARN(logger, cat, fmt, ...)                                                                           \
    (logger).logf(mpt::logging::LogLevel::Warn, mpt::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define MPT_LOGF_ERROR(logger, cat, fmt, ...)                                                                          \
    (logger).logf(mpt::logging::LogLevel::Error, mpt::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace mpt
