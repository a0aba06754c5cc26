#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace skyhop {

using JobId = std::uint64_t;
using ChunkId = std::uint64_t;
using GatewayId = std::uint64_t;
using Clock = std::chrono::steady_clock;

constexpr GatewayId kNoGateway = 0;

// Region tags are written "provider:location", e.g. "aws:us-east-1".
using RegionTag = std::string;

std::string region_provider(const RegionTag &tag);

enum class ChunkState { Pending, Assigned, InFlight, Verifying, Completed, Failed };

const char *to_string(ChunkState state);

struct ObjectSpec {
    std::string source_key;
    std::string destination_key;
    std::uint64_t length;
    // Multicast jobs list an object once per destination region.
    RegionTag destination_region;
};

struct Chunk {
    JobId job_id;
    ChunkId id;
    std::size_t object_index;
    std::string source_key;
    std::string destination_key;
    std::uint64_t offset;
    std::uint64_t length;
    std::uint32_t checksum;
};

// Regions a chunk still has to cross after the gateway holding it; the last one
// is the destination region.
struct PathSegment {
    std::vector<RegionTag> route;
};

bool operator==(const PathSegment &lhs, const PathSegment &rhs);

} // namespace skyhop
