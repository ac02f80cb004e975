#pragma once

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "queue_message.hpp"
#include "shared_ring_buffer.hpp"

#include <string>

namespace mpt {
namespace ipc {

using MessageQueue = SharedRingBuffer<QueueMessage, config::ipc::QUEUE_CAPACITY>;

// Shared-memory names are scoped by run id so concurrent runs never collide
inline std::string shard_queue_name(RunId run_id, ShardId shard) {
    return "/mpt_" + run_id_to_string(run_id) + "_q" + std::to_string(shard);
}

inline std::string scanner_feed_queue_name(RunId run_id) {
    return "/mpt_" + run_id_to_string(run_id) + "_scan";
}

} // namespace ipc
} // namespace mpt
