#pragma once

#include "skyhop/types.hpp"

#include <cstdint>
#include <vector>

namespace skyhop {

struct Demand {
    RegionTag source;
    RegionTag destination;
    std::uint64_t bytes;
};

// Immutable once planning begins.
struct TransferJob {
    JobId id;
    RegionTag source_region;
    // One entry for a unicast copy, several for a multicast.
    std::vector<RegionTag> destination_regions;
    std::vector<ObjectSpec> objects;

    std::uint64_t total_bytes() const;

    // Bytes headed to `destination`.
    std::uint64_t bytes_to(const RegionTag &destination) const;

    // One demand per destination region, in destination order.
    std::vector<Demand> demands() const;
};

} // namespace skyhop
