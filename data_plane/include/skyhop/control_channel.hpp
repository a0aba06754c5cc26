#pragma once

#include "skyhop/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skyhop {

struct AssignChunk {
    Chunk chunk;
    PathSegment segment;
    // Version already consumed by the tracker; the new owner numbers its
    // events from version + 1.
    std::uint64_t version;
};

struct ChunkStateChanged {
    JobId job;
    ChunkId chunk_id;
    ChunkState state;
    std::uint64_t version;
    Clock::time_point timestamp;
    GatewayId gateway;
    std::uint32_t attempts;
    // Failed with no retry left.
    bool permanent;
    // Pending because the gateway gave the chunk up for reassignment.
    bool released;
    std::string error;
};

struct Heartbeat {
    GatewayId gateway;
    Clock::time_point timestamp;
};

struct Cancel {
    JobId job;
};

using ControlMessage = std::variant<AssignChunk, ChunkStateChanged, Heartbeat, Cancel>;

// Unbounded FIFO of control messages between the tracker and gateways.
// Delivery is at-least-once from the consumer's point of view; consumers
// deduplicate.
class ControlChannel {
  public:
    void publish(ControlMessage message);

    // Waits up to `timeout` for a message; nullopt on timeout or once closed
    // and drained.
    std::optional<ControlMessage> poll(std::chrono::milliseconds timeout);

    std::vector<ControlMessage> drain();

    void close();

    bool closed() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ControlMessage> messages_;
    bool closed_{false};
};

} // namespace skyhop
