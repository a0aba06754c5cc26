#pragma once

#include "skyhop/config.hpp"
#include "skyhop/errors.hpp"
#include "skyhop/gateway.hpp"
#include "skyhop/object_store.hpp"
#include "skyhop/planner.hpp"
#include "skyhop/progress_tracker.hpp"
#include "skyhop/provisioner.hpp"
#include "skyhop/region_graph.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skyhop {

struct TransferDestination {
    RegionTag region;
    // Parallel to the request's source_keys; left empty, objects keep their
    // source keys.
    std::vector<std::string> keys;
};

// A request with several destinations is a multicast: every source object is
// copied to each of them.
struct TransferRequest {
    RegionTag source_region;
    std::vector<std::string> source_keys;
    std::vector<TransferDestination> destinations;
    // Replaces the service-wide planning constraints for this job.
    std::optional<PlanConstraints> constraints;
};

struct PrefixDestination {
    RegionTag region;
    std::string prefix;
};

struct JobResult {
    JobStatus status;
    TransferPlan plan;
    // Chunks that failed permanently within the failure tolerance.
    std::vector<FailedChunk> failed_chunks;
};

// Accepts transfer jobs and runs each one: plan, provision gateways, feed
// chunks, supervise progress and tear down. Planning and provisioning errors
// surface from submit(); everything later surfaces from wait().
class TransferService {
  public:
    TransferService(RegionGraph graph, TransferConfig config,
                    std::map<RegionTag, std::shared_ptr<ObjectStore>> stores, std::shared_ptr<Provisioner> provisioner);

    ~TransferService();

    TransferService(const TransferService &) = delete;
    TransferService &operator=(const TransferService &) = delete;

    // Throws PlanningInfeasible, ProvisioningFailure, ObjectStoreError,
    // ConfigError (an object too large to chunk) or std::invalid_argument.
    JobId submit(const TransferRequest &request);

    // Copies every object under `source_prefix`, replacing the prefix with
    // `destination_prefix` in the destination keys.
    JobId submit_prefix(const RegionTag &source_region, const RegionTag &destination_region,
                        const std::string &source_prefix, const std::string &destination_prefix);

    // Multicast form: one copy of the prefix per destination.
    JobId submit_prefix(const RegionTag &source_region, const std::string &source_prefix,
                        const std::vector<PrefixDestination> &destinations);

    JobStatus status(JobId job) const;

    void cancel(JobId job);

    // Blocks until the job ends. Throws JobAborted unless it succeeded.
    JobResult wait(JobId job);

    TransferPlan plan(JobId job) const;

    std::vector<std::shared_ptr<Gateway>> gateways(JobId job) const;

  private:
    class Job;

    Job &find(JobId job) const;
    std::shared_ptr<ObjectStore> store(const RegionTag &region) const;

    RegionGraph graph_;
    TransferConfig config_;
    std::map<RegionTag, std::shared_ptr<ObjectStore>> stores_;
    std::shared_ptr<Provisioner> provisioner_;
    TransferPlanner planner_;

    mutable std::mutex mutex_;
    std::map<JobId, std::unique_ptr<Job>> jobs_;
    JobId next_job_id_{1};
};

} // namespace skyhop
