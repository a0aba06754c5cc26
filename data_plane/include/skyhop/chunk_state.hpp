#pragma once

#include "skyhop/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyhop {

bool is_terminal(ChunkState state);

// Pending -> Assigned -> InFlight -> Verifying -> Completed | Failed, plus
// failure from Assigned/InFlight, retry Failed -> Pending, and release of
// Assigned/InFlight chunks back to Pending for reassignment.
bool can_transition(ChunkState from, ChunkState to);

struct ChunkRecord {
    Chunk chunk;
    PathSegment segment;
    ChunkState state = ChunkState::Pending;
    GatewayId owner = kNoGateway;
    std::uint64_t version = 0;
    std::uint32_t attempts = 0;
    std::uint32_t reassignments = 0;
    bool permanent_failure = false;
    std::string last_error;
    Clock::time_point updated{};

    // Throws std::logic_error on an illegal transition.
    void transition(ChunkState to);

    // Completed, or Failed with the retry budget spent.
    bool finished() const;
};

// Arena of chunk records indexed by chunk id. Not synchronised; the owner of
// the table serialises access.
class ChunkTable {
  public:
    ChunkRecord &insert(Chunk chunk, PathSegment segment, GatewayId owner);

    ChunkRecord *find(ChunkId id);

    const ChunkRecord *find(ChunkId id) const;

    std::size_t size() const noexcept { return records_.size(); }

    std::size_t count(ChunkState state) const;

    // Unfinished chunks held by `owner`, in id order.
    std::vector<ChunkId> outstanding(GatewayId owner) const;

    const std::vector<ChunkRecord> &records() const noexcept { return records_; }

  private:
    std::vector<ChunkRecord> records_;
    std::unordered_map<ChunkId, std::size_t> index_;
};

} // namespace skyhop
