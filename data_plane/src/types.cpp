#include "skyhop/types.hpp"

namespace skyhop {

std::string region_provider(const RegionTag &tag) {
    auto pos = tag.find(':');
    if (pos == std::string::npos) {
        return tag;
    }
    return tag.substr(0, pos);
}

const char *to_string(ChunkState state) {
    switch (state) {
    case ChunkState::Pending:
        return "Pending";
    case ChunkState::Assigned:
        return "Assigned";
    case ChunkState::InFlight:
        return "InFlight";
    case ChunkState::Verifying:
        return "Verifying";
    case ChunkState::Completed:
        return "Completed";
    case ChunkState::Failed:
        return "Failed";
    }
    return "Unknown";
}

bool operator==(const PathSegment &lhs, const PathSegment &rhs) { return lhs.route == rhs.route; }

} // namespace skyhop
