#pragma once

#include "skyhop/network.hpp"
#include "skyhop/types.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace skyhop {

struct GatewayAddress {
    GatewayId id;
    RegionTag region;
    NetworkEndpoint endpoint;
};

// Which gateways serve which region, and which of them are still healthy.
// Shared by every gateway of a job so relays can pick their next hop.
class GatewayDirectory {
  public:
    void add(GatewayAddress address);

    void mark_unhealthy(GatewayId id);

    bool healthy(GatewayId id) const;

    // Healthy gateway of `region` picked by `salt`, spreading callers across
    // instances deterministically.
    std::optional<GatewayAddress> resolve(const RegionTag &region, std::size_t salt) const;

    std::vector<GatewayAddress> healthy_in(const RegionTag &region) const;

  private:
    mutable std::mutex mutex_;
    std::map<GatewayId, GatewayAddress> gateways_;
    std::map<GatewayId, bool> healthy_;
};

} // namespace skyhop
