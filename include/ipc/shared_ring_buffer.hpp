#pragma once

#include "../util/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <new>
#include <stdexcept>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <thread>
#include <type_traits>
#include <unistd.h>

namespace mpt {
namespace ipc {

/**
 * SharedRingBuffer - Lock-free SPSC queue in shared memory
 *
 * Design:
 * - Single Producer Single Consumer (SPSC) - no locks needed
 * - Shared memory for inter-process communication; the orchestrator
 *   creates every queue before forking, workers open theirs by name
 * - Cache-line aligned head/tail to prevent false sharing
 * - Power-of-2 size for fast modulo (bitwise AND)
 *
 * Memory Layout:
 * [Header: 128 bytes] [Data: N * sizeof(T) bytes]
 *   - head (64 bytes, cache-line aligned)
 *   - tail (64 bytes, cache-line aligned)
 *   - data[N]
 *
 * Usage:
 *   Orchestrator:
 *     SharedRingBuffer<QueueMessage> q("/mpt_<run>_q0", true);
 *   Producer (forked child):
 *     q.send(msg, token, timeout);       // waits while full
 *   Consumer (forked child):
 *     QueueMessage m;
 *     if (q.receive(m, token, timeout)) { handle(m); }
 *
 * @tparam T Element type (must be trivially copyable)
 * @tparam N Buffer size (must be power of 2)
 */
template <typename T, size_t N = 4096>
class SharedRingBuffer {
    static_assert((N & (N - 1)) == 0, "N must be power of 2");
    static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");

public:
    static constexpr size_t CAPACITY = N;
    static constexpr uint64_t MAGIC = 0x4D50545155455545; // "MPTQUEUE"

    struct alignas(64) Header {
        alignas(64) std::atomic<uint64_t> head{0}; // Producer writes here
        alignas(64) std::atomic<uint64_t> tail{0}; // Consumer writes here
        uint64_t capacity{N};
        uint64_t element_size{sizeof(T)};
        uint64_t magic{MAGIC};
        char padding[64 - 40];
    };

    static_assert(sizeof(Header) == 128, "Header should be 128 bytes (2 cache lines)");

private:
    std::string name_;
    int fd_ = -1;
    void* mapped_ = nullptr;
    size_t mapped_size_ = 0;
    bool is_owner_ = false;

    Header* header_ = nullptr;
    T* data_ = nullptr;

public:
    /**
     * Create or open shared ring buffer
     *
     * @param name Shared memory name (e.g., "/mpt_3fa2c1d4e5f60718_q0")
     * @param create If true, create new and unlink on destruction (owner).
     *               If false, open existing.
     */
    explicit SharedRingBuffer(std::string name, bool create = false) : name_(std::move(name)), is_owner_(create) {
        mapped_size_ = sizeof(Header) + N * sizeof(T);

        if (create) {
            shm_unlink(name_.c_str()); // Remove if exists
            fd_ = shm_open(name_.c_str(), O_CREAT | O_RDWR, 0600);
            if (fd_ < 0) {
                throw std::runtime_error("shm_open failed (create): " + name_);
            }

            if (ftruncate(fd_, static_cast<off_t>(mapped_size_)) < 0) {
                close(fd_);
                shm_unlink(name_.c_str());
                throw std::runtime_error("ftruncate failed: " + name_);
            }

            mapped_ = mmap(nullptr, mapped_size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
            if (mapped_ == MAP_FAILED) {
                close(fd_);
                shm_unlink(name_.c_str());
                throw std::runtime_error("mmap failed: " + name_);
            }

            header_ = new (mapped_) Header();
            data_ = reinterpret_cast<T*>(static_cast<char*>(mapped_) + sizeof(Header));
            std::memset(static_cast<void*>(data_), 0, N * sizeof(T));

        } else {
            fd_ = shm_open(name_.c_str(), O_RDWR, 0600);
            if (fd_ < 0) {
                throw std::runtime_error("shm_open failed (open) - is the orchestrator running? " + name_);
            }

            mapped_ = mmap(nullptr, mapped_size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
            if (mapped_ == MAP_FAILED) {
                close(fd_);
                throw std::runtime_error("mmap failed: " + name_);
            }

            header_ = static_cast<Header*>(mapped_);
            data_ = reinterpret_cast<T*>(static_cast<char*>(mapped_) + sizeof(Header));

            if (header_->magic != MAGIC || header_->element_size != sizeof(T) || header_->capacity != N) {
                munmap(mapped_, mapped_size_);
                close(fd_);
                throw std::runtime_error("Invalid shared memory (layout mismatch): " + name_);
            }
        }
    }

    ~SharedRingBuffer() {
        if (mapped_ && mapped_ != MAP_FAILED) {
            munmap(mapped_, mapped_size_);
        }
        if (fd_ >= 0) {
            close(fd_);
        }
        if (is_owner_) {
            shm_unlink(name_.c_str());
        }
    }

    // Non-copyable
    SharedRingBuffer(const SharedRingBuffer&) = delete;
    SharedRingBuffer& operator=(const SharedRingBuffer&) = delete;

    const std::string& name() const { return name_; }

    /**
     * Push element to buffer (producer only)
     *
     * @return true if successful, false if buffer full
     */
    bool push(const T& item) {
        const uint64_t head = header_->head.load(std::memory_order_relaxed);
        const uint64_t tail = header_->tail.load(std::memory_order_acquire);

        if (head - tail >= N) {
            return false;
        }

        const size_t idx = head & (N - 1);
        data_[idx] = item;

        // Publish (release ensures data write is visible before head update)
        header_->head.store(head + 1, std::memory_order_release);
        return true;
    }

    /**
     * Pop element from buffer (consumer only)
     *
     * @return true if item was available, false if buffer empty
     */
    bool pop(T& item) {
        const uint64_t tail = header_->tail.load(std::memory_order_relaxed);
        const uint64_t head = header_->head.load(std::memory_order_acquire);

        if (tail >= head) {
            return false;
        }

        const size_t idx = tail & (N - 1);
        item = data_[idx];

        header_->tail.store(tail + 1, std::memory_order_release);
        return true;
    }

    /**
     * Blocking push: waits up to timeout while the buffer is full.
     *
     * @return true once pushed, false on timeout or cancellation
     */
    bool send(const T& item, const util::CancellationToken& token, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        auto backoff = std::chrono::microseconds(50);
        while (!push(item)) {
            if (token.cancelled() || std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(backoff);
            if (backoff < std::chrono::milliseconds(config::ipc::WAIT_POLL_MS)) {
                backoff *= 2;
            }
        }
        return true;
    }

    /**
     * Blocking pop: waits up to timeout for an element.
     *
     * @return true if an item was received, false on timeout or cancellation
     */
    bool receive(T& item, const util::CancellationToken& token, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        auto backoff = std::chrono::microseconds(50);
        while (!pop(item)) {
            if (token.cancelled() || std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(backoff);
            if (backoff < std::chrono::milliseconds(config::ipc::WAIT_POLL_MS)) {
                backoff *= 2;
            }
        }
        return true;
    }

    // Stats
    size_t size() const {
        const uint64_t head = header_->head.load(std::memory_order_acquire);
        const uint64_t tail = header_->tail.load(std::memory_order_acquire);
        return static_cast<size_t>(head - tail);
    }

    bool empty() const { return size() == 0; }
    bool full() const { return size() >= N; }
    size_t capacity() const { return N; }

    uint64_t total_produced() const { return header_->head.load(std::memory_order_acquire); }
    uint64_t total_consumed() const { return header_->tail.load(std::memory_order_acquire); }
};

} // namespace ipc
} // namespace mpt
