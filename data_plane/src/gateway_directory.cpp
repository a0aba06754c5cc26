#include "skyhop/gateway_directory.hpp"

namespace skyhop {

void GatewayDirectory::add(GatewayAddress address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = address.id;
    gateways_[id] = std::move(address);
    healthy_[id] = true;
}

void GatewayDirectory::mark_unhealthy(GatewayId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = healthy_.find(id);
    if (it != healthy_.end()) {
        it->second = false;
    }
}

bool GatewayDirectory::healthy(GatewayId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = healthy_.find(id);
    return it != healthy_.end() && it->second;
}

std::optional<GatewayAddress> GatewayDirectory::resolve(const RegionTag &region, std::size_t salt) const {
    auto candidates = healthy_in(region);
    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates[salt % candidates.size()];
}

std::vector<GatewayAddress> GatewayDirectory::healthy_in(const RegionTag &region) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GatewayAddress> result;
    for (const auto &entry : gateways_) {
        if (entry.second.region == region && healthy_.at(entry.first)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

} // namespace skyhop
