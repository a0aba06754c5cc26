#pragma once

#include "skyhop/object_store.hpp"
#include "skyhop/transfer_job.hpp"
#include "skyhop/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace skyhop {

struct ChunkPolicy {
    std::uint64_t chunk_bytes = 64ull << 20;
    std::uint64_t min_chunk_bytes = 1ull << 20;
    std::uint64_t max_chunk_bytes = 1ull << 30;
    // Objects up to this size travel as a single chunk.
    std::uint64_t whole_object_bytes = 64ull << 20;
    // Multipart uploads accept at most this many parts per object.
    std::uint32_t max_parts_per_object = 10000;

    void validate() const;

    // Throws ConfigError when the object cannot be cut into at most
    // max_parts_per_object chunks of max_chunk_bytes.
    std::uint64_t chunk_size_for(std::uint64_t object_length) const;
};

struct ChunkCursor {
    std::size_t object_index = 0;
    std::uint64_t offset = 0;
    ChunkId next_id = 0;
};

// Lazy, restartable walk over a job's chunks. Two sequences over the same job
// and policy yield identical chunks, ids included.
class ChunkSequence {
  public:
    ChunkSequence(std::shared_ptr<const TransferJob> job, std::shared_ptr<ObjectStore> source, ChunkPolicy policy);

    std::optional<Chunk> next();

    bool done() const noexcept;

    ChunkCursor position() const noexcept { return cursor_; }

    void seek(const ChunkCursor &cursor);

    void restart() { seek(ChunkCursor{}); }

  private:
    std::uint32_t checksum(const ObjectSpec &object, std::uint64_t offset, std::uint64_t length) const;

    std::shared_ptr<const TransferJob> job_;
    std::shared_ptr<ObjectStore> source_;
    ChunkPolicy policy_;
    ChunkCursor cursor_;
};

class Chunker {
  public:
    Chunker(std::shared_ptr<ObjectStore> source, ChunkPolicy policy);

    ChunkSequence chunk(std::shared_ptr<const TransferJob> job) const;

    std::vector<Chunk> chunk_all(std::shared_ptr<const TransferJob> job) const;

    const ChunkPolicy &policy() const noexcept { return policy_; }

  private:
    std::shared_ptr<ObjectStore> source_;
    ChunkPolicy policy_;
};

} // namespace skyhop
