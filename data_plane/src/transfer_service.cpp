#include "skyhop/transfer_service.hpp"

#include "skyhop/chunker.hpp"
#include "skyhop/job_context.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace skyhop {

class TransferService::Job {
  public:
    Job(std::shared_ptr<const TransferJob> job, TransferPlan plan, const TransferConfig &config,
        std::shared_ptr<ObjectStore> source, std::map<RegionTag, std::shared_ptr<ObjectStore>> destinations,
        std::shared_ptr<Provisioner> provisioner)
        : job_(std::move(job)), plan_(std::move(plan)), source_(std::move(source)),
          destinations_(std::move(destinations)), provisioner_(std::move(provisioner)),
          context_(std::make_shared<JobContext>(job_->id, config)), tracker_(job_, config.tracker),
          sequence_(job_, source_, config.chunking) {
        for (const auto &destination : job_->destination_regions) {
            auto &routes = routes_[destination];
            routes.paths = plan_.paths_between(job_->source_region, destination);
            if (routes.paths.empty()) {
                throw std::invalid_argument("plan has no path to " + destination + " for job " +
                                            std::to_string(job_->id));
            }
            routes.weights.assign(routes.paths.size(), 0);
        }
    }

    ~Job() {
        cancel();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Provisions the plan's gateways and starts the control loop.
    void start() {
        try {
            for (const auto &region : plan_.regions) {
                if (region.tag == job_->source_region) {
                    continue;
                }
                for (std::uint32_t i = 0; i < region.instances; ++i) {
                    provision(region.tag);
                }
            }
            for (std::uint32_t i = 0; i < plan_.instances(job_->source_region); ++i) {
                provision(job_->source_region);
            }
        } catch (const ProvisioningFailure &) {
            release_gateways();
            throw;
        }
        thread_ = std::thread(&Job::run, this);
    }

    void cancel() {
        cancel_requested_ = true;
        context_->cancelled = true;
    }

    JobResult wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        finished_cv_.wait(lock, [&] { return finished_; });
        auto status = tracker_.status();
        if (status.state != JobState::Succeeded) {
            throw JobAborted(job_->id, reason_, tracker_.failures());
        }
        return JobResult{status, plan_, tracker_.failures()};
    }

    JobStatus status() const { return tracker_.status(); }

    const TransferPlan &plan() const noexcept { return plan_; }

    std::vector<std::shared_ptr<Gateway>> gateways() const {
        std::lock_guard<std::mutex> lock(gateways_mutex_);
        return gateways_;
    }

  private:
    void run() {
        const auto &tracker_config = context_->config.tracker;
        try {
            while (true) {
                if (cancel_requested_) {
                    finish(JobState::Cancelled, "cancelled by request");
                    break;
                }
                dispatch();
                pump(tracker_config.poll_interval);
                recover();
                auto failed = tracker_.permanently_failed();
                if (failed > tracker_config.failure_tolerance) {
                    std::ostringstream oss;
                    oss << failed << " chunks failed permanently, tolerance is "
                        << tracker_config.failure_tolerance;
                    finish(JobState::Aborted, oss.str());
                    break;
                }
                if (tracker_.settled()) {
                    finish(JobState::Succeeded, "");
                    break;
                }
            }
        } catch (const ProvisioningFailure &e) {
            finish(JobState::Aborted, std::string("no healthy gateway remains: ") + e.what());
        } catch (const ObjectStoreError &e) {
            finish(JobState::Aborted, std::string("source store failed: ") + e.what());
        }
        teardown();
    }

    void dispatch() {
        auto window = context_->config.tracker.dispatch_window;
        if (window == 0) {
            window = std::max<std::size_t>(1, 4 * source_workers());
        }
        while (!sequence_.done() && tracker_.unfinished() < window && !cancel_requested_) {
            auto chunk = sequence_.next();
            if (!chunk) {
                break;
            }
            auto gateway = pick_source_gateway();
            auto segment = next_segment(job_->objects[chunk->object_index].destination_region);
            tracker_.register_chunk(*chunk, segment, gateway->id());
            gateway->inbox().publish(AssignChunk{*chunk, segment, 0});
        }
        if (sequence_.done() && !chunking_finished_) {
            tracker_.chunking_finished();
            chunking_finished_ = true;
        }
    }

    void pump(std::chrono::milliseconds wait) {
        std::vector<ControlMessage> messages;
        if (auto first = context_->events.poll(wait)) {
            messages.push_back(std::move(*first));
        }
        for (auto &message : context_->events.drain()) {
            messages.push_back(std::move(message));
        }
        for (const auto &message : messages) {
            if (const auto *event = std::get_if<ChunkStateChanged>(&message)) {
                tracker_.apply(*event);
            } else if (const auto *heartbeat = std::get_if<Heartbeat>(&message)) {
                tracker_.heartbeat(*heartbeat);
            }
        }
    }

    void recover() {
        for (auto id : tracker_.take_released()) {
            reassign(id, "released by its gateway");
        }
        for (auto id : tracker_.stalled_gateways(Clock::now())) {
            GatewayUnreachable unreachable(id);
            std::cerr << "job " << job_->id << ": " << unreachable.what() << std::endl;
            tracker_.mark_dead(id);
            context_->directory.mark_unhealthy(id);
            auto gateway = find_gateway(id);
            auto outstanding = tracker_.outstanding(id);
            for (auto chunk : outstanding) {
                reassign(chunk, unreachable.what());
            }
            if (!outstanding.empty()) {
                std::cerr << "job " << job_->id << ": reassigned " << outstanding.size() << " chunks from gateway "
                          << id << std::endl;
            }
            if (gateway) {
                retire(gateway);
            }
        }
        // Gateways also mark the next hops they cannot reach; a region left
        // without a healthy gateway gets a fresh one.
        for (const auto &region : plan_.regions) {
            if (context_->directory.healthy_in(region.tag).empty()) {
                std::cerr << "job " << job_->id << ": no healthy gateway left in " << region.tag
                          << ", provisioning a replacement" << std::endl;
                provision(region.tag);
            }
        }
    }

    void reassign(ChunkId id, const std::string &reason) {
        auto target = pick_source_gateway();
        if (auto assign = tracker_.reassign(id, target->id(), reason)) {
            target->inbox().publish(*assign);
        }
    }

    std::shared_ptr<Gateway> pick_source_gateway() {
        std::vector<std::shared_ptr<Gateway>> candidates;
        {
            std::lock_guard<std::mutex> lock(gateways_mutex_);
            for (const auto &gateway : gateways_) {
                if (gateway->region() == job_->source_region && retired_.count(gateway->id()) == 0 &&
                    tracker_.alive(gateway->id()) && context_->directory.healthy(gateway->id())) {
                    candidates.push_back(gateway);
                }
            }
        }
        if (candidates.empty()) {
            std::cerr << "job " << job_->id << ": no healthy gateway left in " << job_->source_region
                      << ", provisioning a replacement" << std::endl;
            return provision(job_->source_region);
        }
        return candidates[next_source_++ % candidates.size()];
    }

    // Smooth weighted round-robin over the plan's paths to `destination`,
    // weighted by their connection counts.
    PathSegment next_segment(const RegionTag &destination) {
        auto &routes = routes_.at(destination);
        std::int64_t total = 0;
        std::size_t best = 0;
        for (std::size_t i = 0; i < routes.paths.size(); ++i) {
            routes.weights[i] += routes.paths[i].connections;
            total += routes.paths[i].connections;
            if (routes.weights[i] > routes.weights[best]) {
                best = i;
            }
        }
        routes.weights[best] -= total;
        const auto &regions = routes.paths[best].regions;
        return PathSegment{std::vector<RegionTag>(regions.begin() + 1, regions.end())};
    }

    std::size_t source_workers() const {
        std::uint32_t connections = 0;
        for (const auto &entry : routes_) {
            for (const auto &path : entry.second.paths) {
                connections += path.connections;
            }
        }
        return std::max<std::size_t>(1, connections);
    }

    std::size_t workers_for(const RegionTag &region) const {
        if (region != job_->source_region) {
            return 0;
        }
        std::size_t instances = std::max<std::uint32_t>(1, plan_.instances(region));
        return (source_workers() + instances - 1) / instances;
    }

    std::shared_ptr<Gateway> provision(const RegionTag &region) {
        auto destination = destinations_.find(region);
        GatewayRequest request{region, workers_for(region), context_,
                               region == job_->source_region ? source_ : nullptr,
                               destination == destinations_.end() ? nullptr : destination->second};
        auto gateway = provisioner_->provision(request);
        tracker_.register_gateway(gateway->id());
        std::lock_guard<std::mutex> lock(gateways_mutex_);
        gateways_.push_back(gateway);
        return gateway;
    }

    std::shared_ptr<Gateway> find_gateway(GatewayId id) const {
        std::lock_guard<std::mutex> lock(gateways_mutex_);
        for (const auto &gateway : gateways_) {
            if (gateway->id() == id) {
                return gateway;
            }
        }
        return nullptr;
    }

    void retire(const std::shared_ptr<Gateway> &gateway) {
        {
            std::lock_guard<std::mutex> lock(gateways_mutex_);
            if (!retired_.insert(gateway->id()).second) {
                return;
            }
        }
        provisioner_->release(gateway);
    }

    void release_gateways() {
        for (const auto &gateway : gateways()) {
            retire(gateway);
        }
    }

    void finish(JobState state, const std::string &reason) {
        tracker_.finish(state);
        std::lock_guard<std::mutex> lock(mutex_);
        reason_ = reason;
        if (state != JobState::Succeeded) {
            std::cerr << "job " << job_->id << " " << to_string(state) << ": " << reason << std::endl;
        }
    }

    void teardown() {
        bool succeeded = tracker_.status().state == JobState::Succeeded;
        if (!succeeded) {
            context_->cancelled = true;
            for (const auto &gateway : gateways()) {
                gateway->inbox().publish(Cancel{job_->id});
            }
        }
        release_gateways();
        if (!succeeded && context_->config.tracker.discard_partial_objects) {
            discard_partial_objects();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        finished_cv_.notify_all();
    }

    void discard_partial_objects() {
        for (std::size_t i = 0; i < job_->objects.size(); ++i) {
            if (tracker_.object_delivered(i)) {
                continue;
            }
            const auto &object = job_->objects[i];
            const auto &key = object.destination_key;
            try {
                destinations_.at(object.destination_region)->remove(key);
            } catch (const ObjectStoreError &e) {
                std::cerr << "job " << job_->id << ": cannot discard partial object " << key << ": " << e.what()
                          << std::endl;
            }
        }
    }

    std::shared_ptr<const TransferJob> job_;
    TransferPlan plan_;
    std::shared_ptr<ObjectStore> source_;
    std::map<RegionTag, std::shared_ptr<ObjectStore>> destinations_;
    std::shared_ptr<Provisioner> provisioner_;
    std::shared_ptr<JobContext> context_;
    ProgressTracker tracker_;
    ChunkSequence sequence_;
    bool chunking_finished_{false};

    struct Routes {
        std::vector<PlannedPath> paths;
        std::vector<std::int64_t> weights;
    };
    std::map<RegionTag, Routes> routes_;
    std::size_t next_source_{0};

    mutable std::mutex gateways_mutex_;
    std::vector<std::shared_ptr<Gateway>> gateways_;
    std::set<GatewayId> retired_;

    std::thread thread_;
    std::atomic<bool> cancel_requested_{false};
    std::mutex mutex_;
    std::condition_variable finished_cv_;
    bool finished_{false};
    std::string reason_;
};

TransferService::TransferService(RegionGraph graph, TransferConfig config,
                                 std::map<RegionTag, std::shared_ptr<ObjectStore>> stores,
                                 std::shared_ptr<Provisioner> provisioner)
    : graph_(std::move(graph)), config_(std::move(config)), stores_(std::move(stores)),
      provisioner_(std::move(provisioner)) {
    if (!provisioner_) {
        throw std::invalid_argument("transfer service needs a provisioner");
    }
    config_.validate();
}

TransferService::~TransferService() {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
}

JobId TransferService::submit(const TransferRequest &request) {
    if (request.destinations.empty()) {
        throw std::invalid_argument("a transfer needs at least one destination");
    }
    std::set<RegionTag> seen;
    for (const auto &destination : request.destinations) {
        if (destination.region == request.source_region) {
            throw std::invalid_argument("source and destination regions must differ");
        }
        if (!seen.insert(destination.region).second) {
            throw std::invalid_argument("destination " + destination.region + " listed twice");
        }
        if (!destination.keys.empty() && destination.keys.size() != request.source_keys.size()) {
            throw std::invalid_argument("destination keys must match source keys one to one");
        }
    }
    auto source = store(request.source_region);
    std::map<RegionTag, std::shared_ptr<ObjectStore>> destinations;
    for (const auto &destination : request.destinations) {
        destinations.emplace(destination.region, store(destination.region));
    }

    JobId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_job_id_++;
    }
    auto job = std::make_shared<TransferJob>();
    job->id = id;
    job->source_region = request.source_region;
    std::vector<std::uint64_t> sizes;
    for (const auto &key : request.source_keys) {
        sizes.push_back(source->size(key));
    }
    for (const auto &destination : request.destinations) {
        job->destination_regions.push_back(destination.region);
        for (std::size_t i = 0; i < request.source_keys.size(); ++i) {
            const auto &key = request.source_keys[i];
            auto destination_key = destination.keys.empty() ? key : destination.keys[i];
            job->objects.push_back(ObjectSpec{key, destination_key, sizes[i], destination.region});
        }
    }

    auto plan = planner_.plan(graph_, *job, request.constraints ? *request.constraints : config_.planning);
    auto runner = std::make_unique<Job>(job, std::move(plan), config_, source, std::move(destinations), provisioner_);
    runner->start();

    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.emplace(id, std::move(runner));
    return id;
}

JobId TransferService::submit_prefix(const RegionTag &source_region, const RegionTag &destination_region,
                                     const std::string &source_prefix, const std::string &destination_prefix) {
    return submit_prefix(source_region, source_prefix, {PrefixDestination{destination_region, destination_prefix}});
}

JobId TransferService::submit_prefix(const RegionTag &source_region, const std::string &source_prefix,
                                     const std::vector<PrefixDestination> &destinations) {
    TransferRequest request;
    request.source_region = source_region;
    request.source_keys = store(source_region)->list(source_prefix);
    for (const auto &destination : destinations) {
        TransferDestination target{destination.region, {}};
        for (const auto &key : request.source_keys) {
            target.keys.push_back(destination.prefix + key.substr(source_prefix.size()));
        }
        request.destinations.push_back(std::move(target));
    }
    return submit(request);
}

JobStatus TransferService::status(JobId job) const { return find(job).status(); }

void TransferService::cancel(JobId job) { find(job).cancel(); }

JobResult TransferService::wait(JobId job) { return find(job).wait(); }

TransferPlan TransferService::plan(JobId job) const { return find(job).plan(); }

std::vector<std::shared_ptr<Gateway>> TransferService::gateways(JobId job) const { return find(job).gateways(); }

TransferService::Job &TransferService::find(JobId job) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job);
    if (it == jobs_.end()) {
        throw std::invalid_argument("unknown job " + std::to_string(job));
    }
    return *it->second;
}

std::shared_ptr<ObjectStore> TransferService::store(const RegionTag &region) const {
    auto it = stores_.find(region);
    if (it == stores_.end() || !it->second) {
        throw std::invalid_argument("no object store configured for region " + region);
    }
    return it->second;
}

} // namespace skyhop
