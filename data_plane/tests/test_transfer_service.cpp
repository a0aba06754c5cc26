#include "skyhop/errors.hpp"
#include "skyhop/gateway.hpp"
#include "skyhop/loopback.hpp"
#include "skyhop/object_store.hpp"
#include "skyhop/provisioner.hpp"
#include "skyhop/transfer_service.hpp"

#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

const skyhop::RegionTag source_region = "aws:us-east-1";
const skyhop::RegionTag relay_region = "aws:us-west-2";
const skyhop::RegionTag destination_region = "gcp:europe-west1";
const skyhop::RegionTag isolated_region = "azure:eastus";
const skyhop::RegionTag backup_region = "azure:westeurope";

class SlowStore : public skyhop::MemoryObjectStore {
  public:
    explicit SlowStore(std::chrono::milliseconds delay) : delay_(delay) {}

    std::vector<char> get(const std::string &key, std::uint64_t offset, std::uint64_t length) override {
        std::this_thread::sleep_for(delay_);
        return MemoryObjectStore::get(key, offset, length);
    }

  private:
    std::chrono::milliseconds delay_;
};

class CorruptingStore : public skyhop::MemoryObjectStore {
  public:
    void put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) override {
        auto damaged = data;
        if (!damaged.empty()) {
            damaged.back() = static_cast<char>(damaged.back() ^ 0x5a);
        }
        MemoryObjectStore::put(key, offset, damaged);
    }
};

// Refuses writes to one key.
class PickyStore : public skyhop::MemoryObjectStore {
  public:
    explicit PickyStore(std::string refused) : refused_(std::move(refused)) {}

    void put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) override {
        if (key == refused_) {
            throw skyhop::ObjectStoreError("write to " + key + " forbidden", false);
        }
        MemoryObjectStore::put(key, offset, data);
    }

  private:
    std::string refused_;
};

skyhop::RegionGraph relay_graph() {
    std::istringstream in("region aws:us-east-1 4\n"
                          "region aws:us-west-2 4\n"
                          "region gcp:europe-west1 4\n"
                          "region azure:eastus 2\n"
                          "edge aws:us-east-1 gcp:europe-west1 100 0.09 4\n"
                          "edge aws:us-east-1 aws:us-west-2 150 0.02 8\n"
                          "edge aws:us-west-2 gcp:europe-west1 150 0.02 8\n");
    return skyhop::RegionGraph::parse(in);
}

skyhop::RegionGraph direct_graph() {
    std::istringstream in("region aws:us-east-1 4\n"
                          "region gcp:europe-west1 4\n"
                          "edge aws:us-east-1 gcp:europe-west1 100 0.09 4\n");
    return skyhop::RegionGraph::parse(in);
}

skyhop::RegionGraph multicast_graph() {
    std::istringstream in("region aws:us-east-1 4\n"
                          "region gcp:europe-west1 4\n"
                          "region azure:westeurope 4\n"
                          "edge aws:us-east-1 gcp:europe-west1 100 0.09 4\n"
                          "edge aws:us-east-1 azure:westeurope 80 0.08 4\n");
    return skyhop::RegionGraph::parse(in);
}

skyhop::TransferConfig test_config() {
    skyhop::TransferConfig config;
    config.chunking.chunk_bytes = 64 << 10;
    config.chunking.min_chunk_bytes = 4 << 10;
    config.chunking.max_chunk_bytes = 1 << 20;
    config.chunking.whole_object_bytes = 16 << 10;
    config.retry.base_backoff = 1ms;
    config.retry.max_backoff = 10ms;
    config.gateway.stream_block_bytes = 8 << 10;
    config.gateway.relay_buffer_bytes = 32 << 10;
    config.gateway.heartbeat_interval = 20ms;
    config.tracker.liveness_timeout = 500ms;
    config.tracker.poll_interval = 10ms;
    return config;
}

std::vector<char> pattern(std::size_t length, int seed) {
    std::vector<char> data(length);
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<char>((i * 31 + seed + i / 4096) % 251);
    }
    return data;
}

struct Harness {
    std::shared_ptr<skyhop::MemoryObjectStore> source;
    std::shared_ptr<skyhop::MemoryObjectStore> destination;
    std::shared_ptr<skyhop::MemoryObjectStore> backup;
    std::shared_ptr<skyhop::LocalProvisioner> provisioner;
    std::unique_ptr<skyhop::TransferService> service;

    Harness(skyhop::RegionGraph graph, skyhop::TransferConfig config,
            std::shared_ptr<skyhop::MemoryObjectStore> source_store,
            std::shared_ptr<skyhop::MemoryObjectStore> destination_store)
        : source(std::move(source_store)), destination(std::move(destination_store)),
          backup(std::make_shared<skyhop::MemoryObjectStore>()) {
        auto transport = std::make_shared<skyhop::LoopbackTransport>(config.gateway.relay_buffer_bytes);
        provisioner = std::make_shared<skyhop::LocalProvisioner>(transport, "gateway");
        std::map<skyhop::RegionTag, std::shared_ptr<skyhop::ObjectStore>> stores{
            {source_region, source},
            {destination_region, destination},
            {backup_region, backup},
            {isolated_region, std::make_shared<skyhop::MemoryObjectStore>()}};
        service = std::make_unique<skyhop::TransferService>(std::move(graph), config, stores, provisioner);
    }
};

std::shared_ptr<skyhop::Gateway> gateway_in(const std::vector<std::shared_ptr<skyhop::Gateway>> &gateways,
                                            const skyhop::RegionTag &region) {
    for (const auto &gateway : gateways) {
        if (gateway->region() == region) {
            return gateway;
        }
    }
    return nullptr;
}

skyhop::TransferRequest request_for(const skyhop::RegionTag &destination, std::vector<std::string> keys) {
    skyhop::TransferRequest request;
    request.source_region = source_region;
    request.source_keys = std::move(keys);
    request.destinations = {skyhop::TransferDestination{destination, {}}};
    return request;
}

// Budget that admits the relay route but not the direct one.
skyhop::PlanConstraints relay_only(std::uint64_t bytes) {
    skyhop::PlanConstraints constraints;
    constraints.budget = static_cast<double>(bytes) / 1e9 * 0.041;
    return constraints;
}

void wait_for_completed_chunks(skyhop::TransferService &service, skyhop::JobId job, std::size_t chunks) {
    auto deadline = skyhop::Clock::now() + 20s;
    while (service.status(job).completed_chunks < chunks) {
        assert(skyhop::Clock::now() < deadline);
        std::this_thread::sleep_for(2ms);
    }
}

void test_prefix_copy_through_relay() {
    Harness harness(relay_graph(), test_config(), std::make_shared<skyhop::MemoryObjectStore>(),
                    std::make_shared<skyhop::MemoryObjectStore>());
    auto big = pattern(300 << 10, 1);
    auto small = pattern(1000, 2);
    harness.source->insert("data/big.bin", big);
    harness.source->insert("data/small.txt", small);
    harness.source->insert("data/empty", {});
    harness.source->insert("other/skip.bin", pattern(10, 3));

    auto request = request_for(destination_region, {"data/big.bin", "data/small.txt", "data/empty"});
    request.destinations[0].keys = {"copy/big.bin", "copy/small.txt", "copy/empty"};
    request.constraints = relay_only(big.size() + small.size());

    auto job = harness.service->submit(request);
    auto plan = harness.service->plan(job);
    assert(!plan.paths.empty());
    for (const auto &path : plan.paths) {
        assert((path.regions == std::vector<skyhop::RegionTag>{source_region, relay_region, destination_region}));
    }
    auto gateways = harness.service->gateways(job);
    auto relay = gateway_in(gateways, relay_region);
    assert(relay);

    auto result = harness.service->wait(job);
    assert(result.status.state == skyhop::JobState::Succeeded);
    assert(result.status.completed_bytes == big.size() + small.size());
    assert(result.status.total_chunks == 5 + 1 + 1);
    assert(result.status.delivered_objects == 3);
    assert(result.failed_chunks.empty());
    assert(result.plan == plan);
    assert(harness.destination->contents("copy/big.bin") == big);
    assert(harness.destination->contents("copy/small.txt") == small);
    assert(harness.destination->list("copy/empty").size() == 1);
    assert(harness.destination->list("other/").empty());
    assert(relay->stats().bytes_relayed == big.size() + small.size());

    for (const auto &region : {source_region, relay_region, destination_region}) {
        assert(harness.provisioner->active(region) == 0);
    }

    auto again = harness.service->submit_prefix(source_region, destination_region, "data/", "mirror/");
    harness.service->wait(again);
    assert(harness.destination->contents("mirror/big.bin") == big);
    assert(harness.destination->contents("mirror/small.txt") == small);
}

void test_checksum_failures_abort_the_job() {
    auto config = test_config();
    config.retry.retry_budget = 3;
    config.tracker.failure_tolerance = 0;
    Harness harness(direct_graph(), config, std::make_shared<skyhop::MemoryObjectStore>(),
                    std::make_shared<CorruptingStore>());
    harness.source->insert("data/blob.bin", pattern(20000, 4));

    auto job = harness.service->submit(request_for(destination_region, {"data/blob.bin"}));

    bool aborted = false;
    try {
        harness.service->wait(job);
    } catch (const skyhop::JobAborted &e) {
        aborted = true;
        assert(e.job() == job);
        assert(e.failed_chunks().size() == 1);
        const auto &failed = e.failed_chunks().front();
        assert(failed.source_key == "data/blob.bin" && failed.offset == 0);
        assert(failed.attempts == 3);
        assert(std::string(e.what()).find("data/blob.bin") != std::string::npos);
    }
    assert(aborted);
    assert(harness.service->status(job).state == skyhop::JobState::Aborted);
    // The partial object does not survive the abort.
    assert(harness.destination->list("").empty());
}

void test_failures_within_tolerance() {
    auto config = test_config();
    config.tracker.failure_tolerance = 1;
    Harness harness(direct_graph(), config, std::make_shared<skyhop::MemoryObjectStore>(),
                    std::make_shared<PickyStore>("data/denied.bin"));
    auto kept = pattern(5000, 5);
    harness.source->insert("data/kept.bin", kept);
    harness.source->insert("data/denied.bin", pattern(5000, 6));

    auto job = harness.service->submit_prefix(source_region, destination_region, "data/", "data/");
    auto result = harness.service->wait(job);
    assert(result.status.state == skyhop::JobState::Succeeded);
    assert(result.status.failed_chunks == 1);
    assert(result.failed_chunks.size() == 1);
    assert(result.failed_chunks[0].destination_key == "data/denied.bin");
    assert(result.failed_chunks[0].attempts == 1);
    assert(harness.destination->contents("data/kept.bin") == kept);
}

void test_killed_source_gateway_is_replaced() {
    auto source = std::make_shared<SlowStore>(8ms);
    Harness harness(direct_graph(), test_config(), source, std::make_shared<skyhop::MemoryObjectStore>());
    auto data = pattern(2 << 20, 7);
    source->insert("data/large.bin", data);

    auto job = harness.service->submit(request_for(destination_region, {"data/large.bin"}));

    wait_for_completed_chunks(*harness.service, job, 1);
    auto victim = gateway_in(harness.service->gateways(job), source_region);
    assert(victim);
    victim->kill();

    auto result = harness.service->wait(job);
    assert(result.status.state == skyhop::JobState::Succeeded);
    assert(result.status.reassignments > 0);
    assert(harness.destination->contents("data/large.bin") == data);

    std::size_t source_gateways = 0;
    for (const auto &gateway : harness.service->gateways(job)) {
        source_gateways += gateway->region() == source_region ? 1 : 0;
    }
    assert(source_gateways >= 2);
    assert(harness.provisioner->active(source_region) == 0);
}

void test_killed_destination_gateway_is_replaced() {
    auto source = std::make_shared<SlowStore>(8ms);
    Harness harness(direct_graph(), test_config(), source, std::make_shared<skyhop::MemoryObjectStore>());
    auto data = pattern(2 << 20, 10);
    source->insert("data/large.bin", data);

    auto job = harness.service->submit(request_for(destination_region, {"data/large.bin"}));
    wait_for_completed_chunks(*harness.service, job, 1);
    auto victim = gateway_in(harness.service->gateways(job), destination_region);
    assert(victim);
    victim->kill();

    auto result = harness.service->wait(job);
    assert(result.status.state == skyhop::JobState::Succeeded);
    assert(result.failed_chunks.empty());
    assert(harness.destination->contents("data/large.bin") == data);

    std::size_t destination_gateways = 0;
    for (const auto &gateway : harness.service->gateways(job)) {
        destination_gateways += gateway->region() == destination_region ? 1 : 0;
    }
    assert(destination_gateways >= 2);
    assert(harness.provisioner->active(destination_region) == 0);
}

void test_killed_relay_gateway_mid_stream() {
    auto source = std::make_shared<SlowStore>(8ms);
    Harness harness(relay_graph(), test_config(), source, std::make_shared<skyhop::MemoryObjectStore>());
    auto data = pattern(2 << 20, 11);
    source->insert("data/large.bin", data);

    auto request = request_for(destination_region, {"data/large.bin"});
    request.constraints = relay_only(data.size());
    auto job = harness.service->submit(request);
    for (const auto &path : harness.service->plan(job).paths) {
        assert(path.regions.size() == 3);
    }
    wait_for_completed_chunks(*harness.service, job, 1);
    // Every source read sleeps, so the relay dies part way through a chunk.
    auto victim = gateway_in(harness.service->gateways(job), relay_region);
    assert(victim);
    victim->kill();

    auto result = harness.service->wait(job);
    assert(result.status.state == skyhop::JobState::Succeeded);
    assert(result.failed_chunks.empty());
    assert(harness.destination->contents("data/large.bin") == data);

    std::size_t relays = 0;
    for (const auto &gateway : harness.service->gateways(job)) {
        relays += gateway->region() == relay_region ? 1 : 0;
    }
    assert(relays >= 2);
    assert(harness.provisioner->active(relay_region) == 0);
}

void test_multicast_to_two_regions() {
    Harness harness(multicast_graph(), test_config(), std::make_shared<skyhop::MemoryObjectStore>(),
                    std::make_shared<skyhop::MemoryObjectStore>());
    auto big = pattern(200 << 10, 12);
    auto small = pattern(3000, 13);
    harness.source->insert("data/big.bin", big);
    harness.source->insert("data/small.bin", small);

    auto job = harness.service->submit_prefix(
        source_region, "data/",
        {skyhop::PrefixDestination{destination_region, "data/"}, skyhop::PrefixDestination{backup_region, "backup/"}});
    auto plan = harness.service->plan(job);
    assert(!plan.paths_between(source_region, destination_region).empty());
    assert(!plan.paths_between(source_region, backup_region).empty());

    auto result = harness.service->wait(job);
    assert(result.status.state == skyhop::JobState::Succeeded);
    assert(result.status.total_bytes == 2 * (big.size() + small.size()));
    assert(result.status.completed_bytes == result.status.total_bytes);
    assert(result.status.delivered_objects == 4);
    // 200K in 64K chunks is four chunks; the small object goes whole.
    assert(result.status.total_chunks == 2 * (4 + 1));
    assert(harness.destination->contents("data/big.bin") == big);
    assert(harness.destination->contents("data/small.bin") == small);
    assert(harness.backup->contents("backup/big.bin") == big);
    assert(harness.backup->contents("backup/small.bin") == small);
    assert(harness.destination->list("backup/").empty());
    assert(harness.backup->list("data/").empty());
}

void test_cancel_stops_the_job() {
    auto source = std::make_shared<SlowStore>(10ms);
    Harness harness(direct_graph(), test_config(), source, std::make_shared<skyhop::MemoryObjectStore>());
    source->insert("data/large.bin", pattern(2 << 20, 8));

    auto job = harness.service->submit(request_for(destination_region, {"data/large.bin"}));
    wait_for_completed_chunks(*harness.service, job, 1);
    harness.service->cancel(job);

    bool aborted = false;
    try {
        harness.service->wait(job);
    } catch (const skyhop::JobAborted &e) {
        aborted = true;
        assert(e.reason() == "cancelled by request");
    }
    assert(aborted);
    assert(harness.service->status(job).state == skyhop::JobState::Cancelled);
    assert(harness.destination->list("data/").empty());
}

void test_submit_errors() {
    Harness harness(relay_graph(), test_config(), std::make_shared<skyhop::MemoryObjectStore>(),
                    std::make_shared<skyhop::MemoryObjectStore>());
    harness.source->insert("data/a.bin", pattern(100, 9));

    auto rejected = [&](const skyhop::TransferRequest &request) {
        try {
            harness.service->submit(request);
        } catch (const std::invalid_argument &) {
            return true;
        }
        return false;
    };
    auto request = request_for(source_region, {"data/a.bin"});
    assert(rejected(request));
    request.destinations.clear();
    assert(rejected(request));
    request = request_for(destination_region, {"data/a.bin"});
    request.destinations.push_back(skyhop::TransferDestination{destination_region, {}});
    assert(rejected(request));
    request = request_for(destination_region, {"data/a.bin"});
    request.destinations[0].keys = {"x", "y"};
    assert(rejected(request));

    request = request_for(isolated_region, {"data/a.bin"});
    bool infeasible = false;
    try {
        harness.service->submit(request);
    } catch (const skyhop::PlanningInfeasible &e) {
        infeasible = true;
        assert(e.unreachable().size() == 1);
        assert(e.unreachable()[0].destination == isolated_region);
    }
    assert(infeasible);

    request = request_for(destination_region, {"data/missing.bin"});
    bool missing = false;
    try {
        harness.service->submit(request);
    } catch (const skyhop::ObjectStoreError &e) {
        missing = true;
        assert(!e.transient());
    }
    assert(missing);

    request.source_keys = {"data/a.bin"};
    harness.provisioner->set_region_quota(source_region, 0);
    bool unprovisioned = false;
    try {
        harness.service->submit(request);
    } catch (const skyhop::ProvisioningFailure &e) {
        unprovisioned = true;
        assert(e.region() == source_region);
    }
    assert(unprovisioned);
    assert(harness.provisioner->active(destination_region) == 0);
    assert(harness.provisioner->active(relay_region) == 0);

    bool unknown = false;
    try {
        harness.service->status(999);
    } catch (const std::invalid_argument &) {
        unknown = true;
    }
    assert(unknown);
}

} // namespace

int main() {
    test_prefix_copy_through_relay();
    test_checksum_failures_abort_the_job();
    test_failures_within_tolerance();
    test_killed_source_gateway_is_replaced();
    test_killed_destination_gateway_is_replaced();
    test_killed_relay_gateway_mid_stream();
    test_multicast_to_two_regions();
    test_cancel_stops_the_job();
    test_submit_errors();
    return 0;
}
