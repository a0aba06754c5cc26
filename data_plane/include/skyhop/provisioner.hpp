#pragma once

#include "skyhop/gateway.hpp"
#include "skyhop/job_context.hpp"
#include "skyhop/network.hpp"
#include "skyhop/object_store.hpp"
#include "skyhop/types.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace skyhop {

struct GatewayRequest {
    RegionTag region;
    std::size_t workers;
    std::shared_ptr<JobContext> context;
    std::shared_ptr<ObjectStore> source;
    std::shared_ptr<ObjectStore> destination;
};

// Brings gateways up and down. Implementations own instance lifecycles; the
// returned gateway is already started and registered with the job.
class Provisioner {
  public:
    virtual ~Provisioner() = default;

    // Throws ProvisioningFailure.
    virtual std::shared_ptr<Gateway> provision(const GatewayRequest &request) = 0;

    virtual void release(const std::shared_ptr<Gateway> &gateway) = 0;
};

// Runs gateways as threads of the current process, listening on
// `bind_address` through `transport`.
class LocalProvisioner : public Provisioner {
  public:
    LocalProvisioner(std::shared_ptr<NetworkTransport> transport, std::string bind_address);

    std::shared_ptr<Gateway> provision(const GatewayRequest &request) override;

    void release(const std::shared_ptr<Gateway> &gateway) override;

    // Caps the gateways alive at once in `region`.
    void set_region_quota(const RegionTag &region, std::size_t gateways);

    std::size_t active(const RegionTag &region) const;

    std::size_t provisioned() const noexcept { return provisioned_; }

  private:
    std::shared_ptr<NetworkTransport> transport_;
    std::string bind_address_;
    std::atomic<GatewayId> next_id_{1};
    std::atomic<std::size_t> provisioned_{0};
    mutable std::mutex mutex_;
    std::map<RegionTag, std::size_t> quota_;
    std::map<RegionTag, std::size_t> active_;
};

} // namespace skyhop
