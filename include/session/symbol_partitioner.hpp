#pragma once

#include "../types.hpp"

#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpt {
namespace session {

/**
 * Source of shard ids. Injected so tests can pin the assignment.
 */
class IShardRandom {
public:
    virtual ~IShardRandom() = default;

    /// Uniform draw in [0, bound)
    virtual ShardId next_shard(int bound) = 0;
};

/**
 * OS entropy (std::random_device), never seeded, so assignments differ
 * from run to run.
 */
class SystemShardRandom : public IShardRandom {
public:
    ShardId next_shard(int bound) override {
        std::uniform_int_distribution<int> dist(0, bound - 1);
        return dist(device_);
    }

private:
    std::random_device device_;
};

/**
 * Result of partitioning: symbol -> shard, plus each shard's symbols in
 * first-seen order. shard_symbols.size() equals the worker count.
 */
struct ShardPlan {
    std::map<std::string, ShardId> assignment;
    std::vector<std::vector<std::string>> shard_symbols;

    int worker_count() const { return static_cast<int>(shard_symbols.size()); }

    // -1 if the symbol is not assigned
    ShardId shard_of(const std::string& symbol) const {
        auto it = assignment.find(symbol);
        return it == assignment.end() ? -1 : it->second;
    }

    /// Place a symbol discovered after partitioning (producer side)
    ShardId add_symbol(const std::string& symbol, IShardRandom& random) {
        auto it = assignment.find(symbol);
        if (it != assignment.end()) {
            return it->second;
        }
        ShardId shard = random.next_shard(worker_count());
        assignment.emplace(symbol, shard);
        shard_symbols[static_cast<size_t>(shard)].push_back(symbol);
        return shard;
    }
};

/**
 * Random symbol-to-shard assignment
 *
 * One forward pass, a uniform draw per symbol, no rebalancing. Shards that
 * receive no symbol stay in the plan (their consumer simply idles).
 */
class SymbolPartitioner {
public:
    explicit SymbolPartitioner(IShardRandom& random) : random_(random) {}

    ShardPlan assign(const std::vector<std::string>& symbols, int worker_count) const {
        if (worker_count < 1) {
            throw std::invalid_argument("worker_count must be >= 1, got " + std::to_string(worker_count));
        }

        ShardPlan plan;
        plan.shard_symbols.resize(static_cast<size_t>(worker_count));
        for (const auto& symbol : symbols) {
            if (plan.assignment.count(symbol)) {
                continue;
            }
            ShardId shard = worker_count == 1 ? 0 : random_.next_shard(worker_count);
            if (shard < 0 || shard >= worker_count) {
                throw std::out_of_range("shard random returned " + std::to_string(shard) + " outside [0, " +
                                        std::to_string(worker_count) + ")");
            }
            plan.assignment.emplace(symbol, shard);
            plan.shard_symbols[static_cast<size_t>(shard)].push_back(symbol);
        }
        return plan;
    }

private:
    IShardRandom& random_;
};

} // namespace session
} // namespace mpt
