#include "skyhop/progress_tracker.hpp"

#include <algorithm>
#include <stdexcept>

namespace skyhop {

const char *to_string(JobState state) {
    switch (state) {
    case JobState::Running:
        return "running";
    case JobState::Succeeded:
        return "succeeded";
    case JobState::Aborted:
        return "aborted";
    case JobState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

ProgressTracker::ProgressTracker(std::shared_ptr<const TransferJob> job, TrackerConfig config)
    : job_(std::move(job)), config_(config), started_(Clock::now()) {
    if (!job_) {
        throw std::invalid_argument("progress tracker needs a job");
    }
    object_bytes_.assign(job_->objects.size(), 0);
    object_done_.assign(job_->objects.size(), false);
}

void ProgressTracker::register_gateway(GatewayId gateway) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_seen_[gateway] = Clock::now();
    dead_.erase(gateway);
}

void ProgressTracker::register_chunk(const Chunk &chunk, const PathSegment &segment, GatewayId owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunk.object_index >= object_bytes_.size()) {
        throw std::invalid_argument("chunk " + std::to_string(chunk.id) + " names an unknown object");
    }
    table_.insert(chunk, segment, owner);
    ++counts_[ChunkState::Pending];
    ++unfinished_;
}

void ProgressTracker::chunking_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunking_complete_ = true;
}

bool ProgressTracker::apply(const ChunkStateChanged &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (dead_.count(event.gateway) == 0) {
        last_seen_[event.gateway] = now;
    }
    auto *record = table_.find(event.chunk_id);
    if (record == nullptr || record->owner != event.gateway || event.version <= record->version ||
        record->finished()) {
        return false;
    }

    auto previous = record->state;
    record->version = event.version;
    record->attempts = event.attempts;
    if (!event.error.empty()) {
        record->last_error = event.error;
    }
    if (event.state == ChunkState::Pending && previous == ChunkState::Failed && !event.released) {
        ++retries_;
    }
    record_transition(*record, event.state);

    if (event.state == ChunkState::Completed) {
        --unfinished_;
        completed_bytes_ += record->chunk.length;
        auto index = record->chunk.object_index;
        object_bytes_[index] += record->chunk.length;
        if (object_bytes_[index] >= job_->objects[index].length) {
            object_done_[index] = true;
        }
    } else if (event.state == ChunkState::Failed && event.permanent) {
        record->permanent_failure = true;
        --unfinished_;
        ++failed_;
    } else if (event.state == ChunkState::Pending && event.released) {
        record->owner = kNoGateway;
        released_.push_back(record->chunk.id);
    }
    return true;
}

void ProgressTracker::heartbeat(const Heartbeat &heartbeat) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dead_.count(heartbeat.gateway) == 0) {
        last_seen_[heartbeat.gateway] = Clock::now();
    }
}

std::vector<GatewayId> ProgressTracker::stalled_gateways(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GatewayId> stalled;
    for (const auto &entry : last_seen_) {
        if (dead_.count(entry.first) == 0 && now - entry.second > config_.liveness_timeout) {
            stalled.push_back(entry.first);
        }
    }
    return stalled;
}

void ProgressTracker::mark_dead(GatewayId gateway) {
    std::lock_guard<std::mutex> lock(mutex_);
    dead_.insert(gateway);
}

bool ProgressTracker::alive(GatewayId gateway) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seen_.count(gateway) != 0 && dead_.count(gateway) == 0;
}

std::optional<GatewayId> ProgressTracker::owner(ChunkId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto *record = table_.find(id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->owner;
}

std::vector<ChunkId> ProgressTracker::outstanding(GatewayId gateway) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.outstanding(gateway);
}

std::vector<ChunkId> ProgressTracker::take_released() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkId> released;
    released.swap(released_);
    return released;
}

std::optional<AssignChunk> ProgressTracker::reassign(ChunkId id, GatewayId gateway, const std::string &reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto *record = table_.find(id);
    if (record == nullptr) {
        throw std::invalid_argument("unknown chunk " + std::to_string(id));
    }
    if (record->finished()) {
        return std::nullopt;
    }
    ++reassignments_;
    if (++record->reassignments > config_.max_reassignments) {
        record->permanent_failure = true;
        record->last_error = reason + "; reassignment limit reached";
        record_transition(*record, ChunkState::Failed);
        --unfinished_;
        ++failed_;
        return std::nullopt;
    }
    record->owner = gateway;
    ++record->version;
    record_transition(*record, ChunkState::Pending);
    return AssignChunk{record->chunk, record->segment, record->version};
}

std::size_t ProgressTracker::unfinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unfinished_;
}

std::size_t ProgressTracker::permanently_failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

bool ProgressTracker::settled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunking_complete_ && unfinished_ == 0;
}

bool ProgressTracker::complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunking_complete_ && unfinished_ == 0 && failed_ == 0;
}

bool ProgressTracker::object_delivered(std::size_t object_index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return object_index < object_done_.size() && object_done_[object_index];
}

std::vector<FailedChunk> ProgressTracker::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FailedChunk> failed;
    for (const auto &record : table_.records()) {
        if (record.state == ChunkState::Failed && record.permanent_failure) {
            const auto &chunk = record.chunk;
            failed.push_back(FailedChunk{chunk.id, chunk.source_key, chunk.destination_key, chunk.offset,
                                         record.attempts, record.last_error});
        }
    }
    return failed;
}

void ProgressTracker::finish(JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == JobState::Running) {
        state_ = state;
    }
}

JobStatus ProgressTracker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto count = [this](ChunkState state) {
        auto it = counts_.find(state);
        return it == counts_.end() ? std::size_t{0} : it->second;
    };

    JobStatus status{};
    status.job_id = job_->id;
    status.state = state_;
    status.total_bytes = job_->total_bytes();
    status.completed_bytes = completed_bytes_;
    status.total_chunks = table_.size();
    status.completed_chunks = count(ChunkState::Completed);
    status.failed_chunks = failed_;
    status.in_flight_chunks = count(ChunkState::Assigned) + count(ChunkState::InFlight) + count(ChunkState::Verifying);
    status.pending_chunks = count(ChunkState::Pending);
    status.retries = retries_;
    status.reassignments = reassignments_;
    status.delivered_objects = 0;
    for (bool done : object_done_) {
        status.delivered_objects += done ? 1 : 0;
    }
    status.chunking_complete = chunking_complete_;
    if (completed_bytes_ > 0) {
        std::chrono::duration<double> elapsed = Clock::now() - started_;
        double rate = static_cast<double>(completed_bytes_) / std::max(elapsed.count(), 1e-6);
        status.eta = std::chrono::duration<double>(static_cast<double>(status.total_bytes - completed_bytes_) / rate);
    }
    return status;
}

void ProgressTracker::record_transition(ChunkRecord &record, ChunkState to) {
    --counts_[record.state];
    ++counts_[to];
    record.state = to;
    record.updated = Clock::now();
}

} // namespace skyhop
