#include "skyhop/work_queue.hpp"

#include <algorithm>
#include <stdexcept>

namespace skyhop {

WorkQueue::WorkQueue(JobId job, GatewayId gateway, EventSink sink)
    : job_(job), gateway_(gateway), sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("work queue needs an event sink");
    }
}

bool WorkQueue::assign(const Chunk &chunk, const PathSegment &segment, std::uint64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    auto it = entries_.find(chunk.id);
    if (it != entries_.end()) {
        auto &record = it->second.record;
        record.version = std::max(record.version, version);
        if (record.state == ChunkState::Completed) {
            ++record.version;
            emit(record);
        } else if (!record.finished()) {
            record.segment = segment;
        }
        return false;
    }
    Entry entry;
    entry.record.chunk = chunk;
    entry.record.segment = segment;
    entry.record.owner = gateway_;
    entry.record.version = version;
    entry.record.updated = Clock::now();
    entries_.emplace(chunk.id, std::move(entry));
    ready_.push_back(chunk.id);
    cv_.notify_one();
    return true;
}

std::optional<WorkItem> WorkQueue::take(std::size_t worker) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!closed_) {
        auto now = Clock::now();
        std::optional<Clock::time_point> earliest;
        for (auto it = ready_.begin(); it != ready_.end();) {
            auto found = entries_.find(*it);
            if (found == entries_.end() || found->second.record.state != ChunkState::Pending ||
                found->second.worker) {
                it = ready_.erase(it);
                continue;
            }
            auto &entry = found->second;
            if (entry.not_before <= now) {
                ready_.erase(it);
                entry.worker = worker;
                entry.record.transition(ChunkState::Assigned);
                ++entry.record.version;
                emit(entry.record);
                return WorkItem{entry.record.chunk, entry.record.segment, entry.record.attempts, entry.deferrals};
            }
            if (!earliest || entry.not_before < *earliest) {
                earliest = entry.not_before;
            }
            ++it;
        }
        if (earliest) {
            cv_.wait_until(lock, *earliest);
        } else {
            cv_.wait(lock);
        }
    }
    return std::nullopt;
}

bool WorkQueue::advance(ChunkId id, std::size_t worker, ChunkState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto *entry = owned(id, worker);
    if (entry == nullptr) {
        return false;
    }
    entry->record.transition(to);
    ++entry->record.version;
    if (to == ChunkState::Completed) {
        entry->worker.reset();
    }
    emit(entry->record);
    return true;
}

bool WorkQueue::fail(ChunkId id, std::size_t worker, const std::string &error, bool retry,
                     std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto *entry = owned(id, worker);
    if (entry == nullptr) {
        return false;
    }
    auto &record = entry->record;
    ++record.attempts;
    record.last_error = error;
    record.permanent_failure = !retry;
    record.transition(ChunkState::Failed);
    ++record.version;
    emit(record);
    entry->worker.reset();
    if (retry) {
        record.transition(ChunkState::Pending);
        ++record.version;
        entry->not_before = Clock::now() + delay;
        emit(record);
        ready_.push_back(id);
        cv_.notify_one();
    }
    return true;
}

bool WorkQueue::defer(ChunkId id, std::size_t worker, const std::string &error, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto *entry = owned(id, worker);
    if (entry == nullptr) {
        return false;
    }
    auto &record = entry->record;
    record.last_error = error;
    // Like a release, this may leave Verifying.
    record.state = ChunkState::Pending;
    record.updated = Clock::now();
    ++record.version;
    emit(record);
    ++entry->deferrals;
    entry->worker.reset();
    entry->not_before = Clock::now() + delay;
    ready_.push_back(id);
    cv_.notify_one();
    return true;
}

std::size_t WorkQueue::release_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t released = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto &record = it->second.record;
        if (record.finished()) {
            ++it;
            continue;
        }
        // Release bypasses the transition table: a chunk caught in Verifying
        // or Failed goes back to Pending as well.
        record.state = ChunkState::Pending;
        record.permanent_failure = false;
        ++record.version;
        emit(record, true);
        it = entries_.erase(it);
        ++released;
    }
    ready_.clear();
    cv_.notify_all();
    return released;
}

void WorkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool WorkQueue::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::all_of(entries_.begin(), entries_.end(),
                       [](const std::pair<const ChunkId, Entry> &entry) { return entry.second.record.finished(); });
}

std::size_t WorkQueue::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [](const std::pair<const ChunkId, Entry> &entry) { return entry.second.record.state == ChunkState::Completed; }));
}

WorkQueue::Entry *WorkQueue::owned(ChunkId id, std::size_t worker) {
    auto it = entries_.find(id);
    if (it == entries_.end() || !it->second.worker || *it->second.worker != worker) {
        return nullptr;
    }
    return &it->second;
}

void WorkQueue::emit(const ChunkRecord &record, bool released) {
    ChunkStateChanged event;
    event.job = job_;
    event.chunk_id = record.chunk.id;
    event.state = record.state;
    event.version = record.version;
    event.timestamp = Clock::now();
    event.gateway = gateway_;
    event.attempts = record.attempts;
    event.permanent = record.state == ChunkState::Failed && record.permanent_failure;
    event.released = released;
    event.error = record.last_error;
    sink_(event);
}

} // namespace skyhop
