#include "skyhop/chunk_state.hpp"

#include <algorithm>
#include <stdexcept>

namespace skyhop {

bool is_terminal(ChunkState state) { return state == ChunkState::Completed || state == ChunkState::Failed; }

bool can_transition(ChunkState from, ChunkState to) {
    switch (from) {
    case ChunkState::Pending:
        return to == ChunkState::Assigned;
    case ChunkState::Assigned:
        return to == ChunkState::InFlight || to == ChunkState::Failed || to == ChunkState::Pending;
    case ChunkState::InFlight:
        return to == ChunkState::Verifying || to == ChunkState::Failed || to == ChunkState::Pending;
    case ChunkState::Verifying:
        return to == ChunkState::Completed || to == ChunkState::Failed;
    case ChunkState::Failed:
        return to == ChunkState::Pending;
    case ChunkState::Completed:
        return false;
    }
    return false;
}

void ChunkRecord::transition(ChunkState to) {
    if (!can_transition(state, to)) {
        throw std::logic_error(std::string("illegal chunk transition ") + to_string(state) + " -> " + to_string(to) +
                               " for chunk " + std::to_string(chunk.id));
    }
    state = to;
    updated = Clock::now();
}

bool ChunkRecord::finished() const {
    return state == ChunkState::Completed || (state == ChunkState::Failed && permanent_failure);
}

ChunkRecord &ChunkTable::insert(Chunk chunk, PathSegment segment, GatewayId owner) {
    auto id = chunk.id;
    if (index_.count(id) != 0) {
        throw std::invalid_argument("duplicate chunk id " + std::to_string(id));
    }
    ChunkRecord record;
    record.chunk = std::move(chunk);
    record.segment = std::move(segment);
    record.owner = owner;
    record.updated = Clock::now();
    index_.emplace(id, records_.size());
    records_.push_back(std::move(record));
    return records_.back();
}

ChunkRecord *ChunkTable::find(ChunkId id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &records_[it->second];
}

const ChunkRecord *ChunkTable::find(ChunkId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &records_[it->second];
}

std::size_t ChunkTable::count(ChunkState state) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
                                                  [state](const ChunkRecord &r) { return r.state == state; }));
}

std::vector<ChunkId> ChunkTable::outstanding(GatewayId owner) const {
    std::vector<ChunkId> ids;
    for (const auto &record : records_) {
        if (record.owner == owner && !record.finished()) {
            ids.push_back(record.chunk.id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace skyhop
