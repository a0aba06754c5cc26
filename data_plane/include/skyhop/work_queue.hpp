#pragma once

#include "skyhop/chunk_state.hpp"
#include "skyhop/control_channel.hpp"
#include "skyhop/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace skyhop {

// What a worker gets when it takes a chunk.
struct WorkItem {
    Chunk chunk;
    PathSegment segment;
    // Failures recorded before this attempt.
    std::uint32_t attempts;
    // Times the chunk was put back because its next hop was unreachable.
    std::uint32_t deferrals;
};

// A gateway's local chunk queue and the only structure its workers share.
// Every state change bumps the chunk's version and is reported through the
// sink while the queue lock is held, so events of one chunk leave in version
// order.
class WorkQueue {
  public:
    using EventSink = std::function<void(const ChunkStateChanged &)>;

    WorkQueue(JobId job, GatewayId gateway, EventSink sink);

    // Idempotent by chunk id. An unfinished chunk keeps its progress and only
    // takes the new segment; a completed one re-reports Completed. Returns true
    // when the chunk was new to this queue.
    bool assign(const Chunk &chunk, const PathSegment &segment, std::uint64_t version);

    // Blocks until a Pending chunk is due, then hands it to `worker` as
    // Assigned. nullopt once the queue is closed.
    std::optional<WorkItem> take(std::size_t worker);

    // False when `worker` no longer owns the chunk, e.g. after release_all().
    bool advance(ChunkId id, std::size_t worker, ChunkState to);

    // Records a failure. With `retry` the chunk returns to Pending once `delay`
    // has passed; otherwise it fails permanently. False when `worker` no longer
    // owns the chunk.
    bool fail(ChunkId id, std::size_t worker, const std::string &error, bool retry, std::chrono::milliseconds delay);

    // Puts the chunk back to Pending once `delay` has passed without charging a
    // failure; for faults of the path rather than the chunk. False when
    // `worker` no longer owns the chunk.
    bool defer(ChunkId id, std::size_t worker, const std::string &error, std::chrono::milliseconds delay);

    // Gives every unfinished chunk back as released Pending and forgets it.
    std::size_t release_all();

    void close();

    bool idle() const;

    std::size_t completed() const;

  private:
    struct Entry {
        ChunkRecord record;
        std::optional<std::size_t> worker;
        Clock::time_point not_before{};
        std::uint32_t deferrals = 0;
    };

    Entry *owned(ChunkId id, std::size_t worker);
    void emit(const ChunkRecord &record, bool released = false);

    JobId job_;
    GatewayId gateway_;
    EventSink sink_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<ChunkId, Entry> entries_;
    std::deque<ChunkId> ready_;
    bool closed_{false};
};

} // namespace skyhop
