#include "skyhop/provisioner.hpp"

#include "skyhop/errors.hpp"

#include <stdexcept>

namespace skyhop {

LocalProvisioner::LocalProvisioner(std::shared_ptr<NetworkTransport> transport, std::string bind_address)
    : transport_(std::move(transport)), bind_address_(std::move(bind_address)) {
    if (!transport_) {
        throw std::invalid_argument("provisioner needs a transport");
    }
}

std::shared_ptr<Gateway> LocalProvisioner::provision(const GatewayRequest &request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto quota = quota_.find(request.region);
        if (quota != quota_.end() && active_[request.region] >= quota->second) {
            throw ProvisioningFailure(request.region, "region quota of " + std::to_string(quota->second) +
                                                          " gateways exhausted");
        }
        ++active_[request.region];
    }

    GatewaySpec spec{next_id_++, request.region, NetworkEndpoint{bind_address_, 0}, request.workers};
    try {
        auto gateway =
            std::make_shared<Gateway>(spec, request.context, transport_, request.source, request.destination);
        gateway->start();
        ++provisioned_;
        return gateway;
    } catch (const Error &e) {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_[request.region];
        throw ProvisioningFailure(request.region, e.what());
    } catch (const std::invalid_argument &e) {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_[request.region];
        throw ProvisioningFailure(request.region, e.what());
    }
}

void LocalProvisioner::release(const std::shared_ptr<Gateway> &gateway) {
    if (!gateway) {
        return;
    }
    gateway->stop();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(gateway->region());
    if (it != active_.end() && it->second > 0) {
        --it->second;
    }
}

void LocalProvisioner::set_region_quota(const RegionTag &region, std::size_t gateways) {
    std::lock_guard<std::mutex> lock(mutex_);
    quota_[region] = gateways;
}

std::size_t LocalProvisioner::active(const RegionTag &region) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(region);
    return it == active_.end() ? 0 : it->second;
}

} // namespace skyhop
