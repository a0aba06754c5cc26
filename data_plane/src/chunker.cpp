#include "skyhop/chunker.hpp"

#include "skyhop/checksum.hpp"
#include "skyhop/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace skyhop {

namespace {

constexpr std::uint64_t checksum_read_bytes = 1u << 20;

} // namespace

void ChunkPolicy::validate() const {
    if (min_chunk_bytes == 0) {
        throw ConfigError("min chunk size must be > 0");
    }
    if (min_chunk_bytes > max_chunk_bytes) {
        throw ConfigError("min chunk size exceeds max chunk size");
    }
    if (chunk_bytes < min_chunk_bytes || chunk_bytes > max_chunk_bytes) {
        throw ConfigError("chunk size must lie within [min, max]");
    }
    if (whole_object_bytes > max_chunk_bytes) {
        throw ConfigError("whole object threshold exceeds max chunk size");
    }
    if (max_parts_per_object == 0) {
        throw ConfigError("max parts per object must be > 0");
    }
}

std::uint64_t ChunkPolicy::chunk_size_for(std::uint64_t object_length) const {
    if (object_length <= whole_object_bytes) {
        return std::max<std::uint64_t>(object_length, 1);
    }
    std::uint64_t size = chunk_bytes;
    std::uint64_t fewest = (object_length + max_parts_per_object - 1) / max_parts_per_object;
    if (fewest > max_chunk_bytes) {
        throw ConfigError("object of " + std::to_string(object_length) + " bytes needs more than " +
                          std::to_string(max_parts_per_object) + " parts of at most " +
                          std::to_string(max_chunk_bytes) + " bytes");
    }
    size = std::max(size, fewest);
    return std::clamp(size, min_chunk_bytes, max_chunk_bytes);
}

ChunkSequence::ChunkSequence(std::shared_ptr<const TransferJob> job, std::shared_ptr<ObjectStore> source,
                             ChunkPolicy policy)
    : job_(std::move(job)), source_(std::move(source)), policy_(policy) {
    if (!job_ || !source_) {
        throw std::invalid_argument("chunk sequence needs a job and a source store");
    }
    policy_.validate();
    for (const auto &object : job_->objects) {
        policy_.chunk_size_for(object.length);
    }
}

bool ChunkSequence::done() const noexcept { return cursor_.object_index >= job_->objects.size(); }

void ChunkSequence::seek(const ChunkCursor &cursor) {
    if (cursor.object_index > job_->objects.size()) {
        throw std::out_of_range("chunk cursor past the end of the job");
    }
    cursor_ = cursor;
}

std::optional<Chunk> ChunkSequence::next() {
    if (done()) {
        return std::nullopt;
    }
    const auto &object = job_->objects[cursor_.object_index];
    const auto size = policy_.chunk_size_for(object.length);
    const auto length = std::min<std::uint64_t>(size, object.length - cursor_.offset);

    Chunk chunk{job_->id,           cursor_.next_id, cursor_.object_index, object.source_key,
                object.destination_key, cursor_.offset,  length,
                checksum(object, cursor_.offset, length)};

    ++cursor_.next_id;
    cursor_.offset += length;
    if (cursor_.offset >= object.length) {
        ++cursor_.object_index;
        cursor_.offset = 0;
    }
    return chunk;
}

std::uint32_t ChunkSequence::checksum(const ObjectSpec &object, std::uint64_t offset, std::uint64_t length) const {
    Checksum::Crc32Accumulator accumulator;
    std::uint64_t done = 0;
    while (done < length) {
        auto block = std::min(checksum_read_bytes, length - done);
        auto data = source_->get(object.source_key, offset + done, block);
        accumulator.update(data.data(), data.size());
        done += block;
    }
    return accumulator.value();
}

Chunker::Chunker(std::shared_ptr<ObjectStore> source, ChunkPolicy policy)
    : source_(std::move(source)), policy_(policy) {
    if (!source_) {
        throw std::invalid_argument("chunker needs a source store");
    }
    policy_.validate();
}

ChunkSequence Chunker::chunk(std::shared_ptr<const TransferJob> job) const {
    return ChunkSequence(std::move(job), source_, policy_);
}

std::vector<Chunk> Chunker::chunk_all(std::shared_ptr<const TransferJob> job) const {
    auto sequence = chunk(std::move(job));
    std::vector<Chunk> chunks;
    while (auto chunk = sequence.next()) {
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

} // namespace skyhop
