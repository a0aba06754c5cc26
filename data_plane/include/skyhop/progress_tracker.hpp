#pragma once

#include "skyhop/chunk_state.hpp"
#include "skyhop/config.hpp"
#include "skyhop/control_channel.hpp"
#include "skyhop/errors.hpp"
#include "skyhop/transfer_job.hpp"
#include "skyhop/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace skyhop {

enum class JobState { Running, Succeeded, Aborted, Cancelled };

const char *to_string(JobState state);

struct JobStatus {
    JobId job_id;
    JobState state;
    std::uint64_t total_bytes;
    std::uint64_t completed_bytes;
    // Chunks created so far; final once chunking_complete is set.
    std::size_t total_chunks;
    std::size_t completed_chunks;
    std::size_t failed_chunks;
    std::size_t in_flight_chunks;
    std::size_t pending_chunks;
    std::uint64_t retries;
    std::size_t reassignments;
    std::size_t delivered_objects;
    bool chunking_complete;
    // Unknown until some bytes completed.
    std::optional<std::chrono::duration<double>> eta;
};

// Aggregates chunk events of one job. An event counts only when it comes from
// the chunk's current owner and carries a newer version than the last applied
// one; replays and stale reports are dropped. Thread-safe.
class ProgressTracker {
  public:
    ProgressTracker(std::shared_ptr<const TransferJob> job, TrackerConfig config);

    void register_gateway(GatewayId gateway);

    void register_chunk(const Chunk &chunk, const PathSegment &segment, GatewayId owner);

    void chunking_finished();

    // True when the event changed the chunk's record.
    bool apply(const ChunkStateChanged &event);

    void heartbeat(const Heartbeat &heartbeat);

    // Live gateways silent for longer than the liveness timeout.
    std::vector<GatewayId> stalled_gateways(Clock::time_point now) const;

    void mark_dead(GatewayId gateway);

    bool alive(GatewayId gateway) const;

    std::optional<GatewayId> owner(ChunkId id) const;

    // Unfinished chunks held by `gateway`.
    std::vector<ChunkId> outstanding(GatewayId gateway) const;

    // Chunks their owner gave back since the last call.
    std::vector<ChunkId> take_released();

    // Hands the chunk to `gateway` under a fresh version. nullopt when the
    // chunk is already finished or has used up its reassignments, in which
    // case it fails permanently.
    std::optional<AssignChunk> reassign(ChunkId id, GatewayId gateway, const std::string &reason);

    // Registered chunks not yet finished.
    std::size_t unfinished() const;

    std::size_t permanently_failed() const;

    // Chunking is over and every chunk is finished.
    bool settled() const;

    // Settled with every chunk Completed.
    bool complete() const;

    bool object_delivered(std::size_t object_index) const;

    std::vector<FailedChunk> failures() const;

    void finish(JobState state);

    JobStatus status() const;

  private:
    void record_transition(ChunkRecord &record, ChunkState to);

    std::shared_ptr<const TransferJob> job_;
    TrackerConfig config_;
    Clock::time_point started_;

    mutable std::mutex mutex_;
    ChunkTable table_;
    std::map<GatewayId, Clock::time_point> last_seen_;
    std::set<GatewayId> dead_;
    std::vector<ChunkId> released_;
    std::map<ChunkState, std::size_t> counts_;
    std::vector<std::uint64_t> object_bytes_;
    std::vector<bool> object_done_;
    std::uint64_t completed_bytes_{0};
    std::uint64_t retries_{0};
    std::size_t reassignments_{0};
    std::size_t failed_{0};
    std::size_t unfinished_{0};
    bool chunking_complete_{false};
    JobState state_{JobState::Running};
};

} // namespace skyhop
