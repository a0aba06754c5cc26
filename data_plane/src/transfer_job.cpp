#include "skyhop/transfer_job.hpp"

namespace skyhop {

std::uint64_t TransferJob::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto &object : objects) {
        total += object.length;
    }
    return total;
}

std::uint64_t TransferJob::bytes_to(const RegionTag &destination) const {
    std::uint64_t total = 0;
    for (const auto &object : objects) {
        if (object.destination_region == destination) {
            total += object.length;
        }
    }
    return total;
}

std::vector<Demand> TransferJob::demands() const {
    std::vector<Demand> demands;
    for (const auto &destination : destination_regions) {
        demands.push_back(Demand{source_region, destination, bytes_to(destination)});
    }
    return demands;
}

} // namespace skyhop
