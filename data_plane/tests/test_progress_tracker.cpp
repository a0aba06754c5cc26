#include "skyhop/progress_tracker.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <string>

namespace {

using namespace std::chrono_literals;

const skyhop::PathSegment direct{{"gcp:europe-west1"}};

std::shared_ptr<const skyhop::TransferJob> two_objects() {
    auto job = std::make_shared<skyhop::TransferJob>();
    job->id = 11;
    job->source_region = "aws:us-east-1";
    job->destination_regions = {"gcp:europe-west1"};
    job->objects = {{"a.bin", "a.bin", 300}, {"b.bin", "b.bin", 100}};
    return job;
}

skyhop::Chunk chunk(skyhop::ChunkId id, std::size_t object, std::uint64_t offset, std::uint64_t length) {
    std::string key = object == 0 ? "a.bin" : "b.bin";
    return skyhop::Chunk{11, id, object, key, key, offset, length, 0};
}

skyhop::ChunkStateChanged event(skyhop::ChunkId id, skyhop::ChunkState state, std::uint64_t version,
                                skyhop::GatewayId gateway, std::uint32_t attempts = 0) {
    skyhop::ChunkStateChanged event{};
    event.job = 11;
    event.chunk_id = id;
    event.state = state;
    event.version = version;
    event.timestamp = skyhop::Clock::now();
    event.gateway = gateway;
    event.attempts = attempts;
    return event;
}

skyhop::ChunkStateChanged permanent(skyhop::ChunkId id, std::uint64_t version, skyhop::GatewayId gateway,
                                    std::uint32_t attempts, const std::string &error) {
    auto failed = event(id, skyhop::ChunkState::Failed, version, gateway, attempts);
    failed.permanent = true;
    failed.error = error;
    return failed;
}

skyhop::ChunkStateChanged released(skyhop::ChunkId id, std::uint64_t version, skyhop::GatewayId gateway) {
    auto pending = event(id, skyhop::ChunkState::Pending, version, gateway);
    pending.released = true;
    return pending;
}

void complete(skyhop::ProgressTracker &tracker, skyhop::ChunkId id, skyhop::GatewayId gateway,
              std::uint64_t first_version = 1) {
    assert(tracker.apply(event(id, skyhop::ChunkState::Assigned, first_version, gateway)));
    assert(tracker.apply(event(id, skyhop::ChunkState::InFlight, first_version + 1, gateway)));
    assert(tracker.apply(event(id, skyhop::ChunkState::Verifying, first_version + 2, gateway)));
    assert(tracker.apply(event(id, skyhop::ChunkState::Completed, first_version + 3, gateway)));
}

void test_progress_and_delivery() {
    skyhop::ProgressTracker tracker(two_objects(), skyhop::TrackerConfig{});
    tracker.register_gateway(1);
    tracker.register_chunk(chunk(0, 0, 0, 200), direct, 1);
    tracker.register_chunk(chunk(1, 0, 200, 100), direct, 1);
    tracker.register_chunk(chunk(2, 1, 0, 100), direct, 1);

    auto status = tracker.status();
    assert(status.job_id == 11 && status.state == skyhop::JobState::Running);
    assert(status.total_bytes == 400 && status.total_chunks == 3 && status.pending_chunks == 3);
    assert(!status.eta);
    assert(!tracker.settled());

    complete(tracker, 0, 1);
    assert(tracker.apply(event(2, skyhop::ChunkState::Assigned, 1, 1)));
    status = tracker.status();
    assert(status.completed_bytes == 200 && status.completed_chunks == 1);
    assert(status.in_flight_chunks == 1 && status.pending_chunks == 1);
    assert(status.eta);
    assert(!tracker.object_delivered(0));

    complete(tracker, 1, 1);
    assert(tracker.object_delivered(0));
    assert(!tracker.object_delivered(1));
    assert(tracker.apply(event(2, skyhop::ChunkState::InFlight, 2, 1)));
    assert(tracker.apply(event(2, skyhop::ChunkState::Verifying, 3, 1)));
    assert(tracker.apply(event(2, skyhop::ChunkState::Completed, 4, 1)));

    // Everything is done, but more chunks could still appear.
    assert(!tracker.settled());
    tracker.chunking_finished();
    assert(tracker.settled() && tracker.complete());
    status = tracker.status();
    assert(status.completed_bytes == status.total_bytes);
    assert(status.delivered_objects == 2);
    assert(status.eta && status.eta->count() == 0.0);

    tracker.finish(skyhop::JobState::Succeeded);
    tracker.finish(skyhop::JobState::Aborted);
    assert(tracker.status().state == skyhop::JobState::Succeeded);
    assert(std::string(skyhop::to_string(skyhop::JobState::Succeeded)) == "succeeded");
}

void test_stale_and_foreign_events_are_dropped() {
    skyhop::ProgressTracker tracker(two_objects(), skyhop::TrackerConfig{});
    tracker.register_chunk(chunk(0, 0, 0, 300), direct, 1);

    assert(tracker.apply(event(0, skyhop::ChunkState::Assigned, 1, 1)));
    assert(tracker.apply(event(0, skyhop::ChunkState::InFlight, 2, 1)));
    // Replayed and reordered.
    assert(!tracker.apply(event(0, skyhop::ChunkState::InFlight, 2, 1)));
    assert(!tracker.apply(event(0, skyhop::ChunkState::Assigned, 1, 1)));
    // Not the owner.
    assert(!tracker.apply(event(0, skyhop::ChunkState::Completed, 9, 2)));
    // Unknown chunk.
    assert(!tracker.apply(event(5, skyhop::ChunkState::Assigned, 1, 1)));

    assert(tracker.apply(event(0, skyhop::ChunkState::Verifying, 3, 1)));
    assert(tracker.apply(event(0, skyhop::ChunkState::Completed, 4, 1)));
    assert(tracker.status().completed_bytes == 300);
    // A finished chunk ignores a late duplicate of its verdict.
    assert(!tracker.apply(event(0, skyhop::ChunkState::Completed, 5, 1)));
    assert(tracker.status().completed_bytes == 300);
}

void test_retries_and_permanent_failures() {
    skyhop::ProgressTracker tracker(two_objects(), skyhop::TrackerConfig{});
    tracker.register_chunk(chunk(0, 0, 0, 300), direct, 1);
    tracker.register_chunk(chunk(1, 1, 0, 100), direct, 1);
    tracker.chunking_finished();

    assert(tracker.apply(event(0, skyhop::ChunkState::Assigned, 1, 1)));
    assert(tracker.apply(event(0, skyhop::ChunkState::Failed, 2, 1, 1)));
    assert(tracker.apply(event(0, skyhop::ChunkState::Pending, 3, 1, 1)));
    assert(tracker.apply(event(0, skyhop::ChunkState::Assigned, 4, 1, 1)));
    assert(tracker.apply(permanent(0, 5, 1, 2, "ChecksumMismatch")));
    assert(tracker.status().retries == 1);

    complete(tracker, 1, 1);
    assert(tracker.settled());
    assert(!tracker.complete());
    assert(tracker.permanently_failed() == 1);
    auto failures = tracker.failures();
    assert(failures.size() == 1);
    assert(failures[0].id == 0 && failures[0].source_key == "a.bin" && failures[0].offset == 0);
    assert(failures[0].attempts == 2 && failures[0].error == "ChecksumMismatch");
    assert(tracker.status().failed_chunks == 1);
}

void test_stalled_gateways_and_reassignment() {
    skyhop::TrackerConfig config;
    config.liveness_timeout = 100ms;
    config.max_reassignments = 1;
    skyhop::ProgressTracker tracker(two_objects(), config);
    tracker.register_gateway(1);
    tracker.register_gateway(2);
    tracker.register_chunk(chunk(0, 0, 0, 150), direct, 1);
    tracker.register_chunk(chunk(1, 0, 150, 150), direct, 1);
    tracker.register_chunk(chunk(2, 1, 0, 100), direct, 1);
    tracker.chunking_finished();

    complete(tracker, 2, 1);
    assert(tracker.apply(event(0, skyhop::ChunkState::Assigned, 1, 1)));
    assert(tracker.apply(event(0, skyhop::ChunkState::InFlight, 2, 1)));

    auto later = skyhop::Clock::now() + 1s;
    tracker.heartbeat(skyhop::Heartbeat{2, later});
    assert(tracker.stalled_gateways(skyhop::Clock::now()).empty());
    auto stalled = tracker.stalled_gateways(later);
    assert(std::find(stalled.begin(), stalled.end(), 1) != stalled.end());

    tracker.mark_dead(1);
    assert(!tracker.alive(1) && tracker.alive(2));
    auto outstanding = tracker.outstanding(1);
    assert((outstanding == std::vector<skyhop::ChunkId>{0, 1}));

    auto moved = tracker.reassign(0, 2, "gateway 1 unreachable");
    assert(moved && moved->chunk.id == 0 && moved->version == 3 && moved->segment == direct);
    assert(tracker.owner(0) == std::optional<skyhop::GatewayId>(2));
    // The dead owner's late report no longer counts.
    assert(!tracker.apply(event(0, skyhop::ChunkState::Completed, 9, 1)));
    complete(tracker, 0, 2, moved->version + 1);
    assert(!tracker.reassign(0, 2, "too late"));

    assert(tracker.reassign(1, 2, "gateway 1 unreachable"));
    assert(tracker.apply(released(1, 5, 2)));
    assert((tracker.take_released() == std::vector<skyhop::ChunkId>{1}));
    assert(tracker.take_released().empty());
    assert(tracker.owner(1) == std::optional<skyhop::GatewayId>(skyhop::kNoGateway));

    // Second move exceeds the limit; the chunk fails for good.
    assert(!tracker.reassign(1, 2, "gateway 2 fenced"));
    assert(tracker.settled());
    assert(tracker.permanently_failed() == 1);
    assert(tracker.failures()[0].error.find("reassignment limit") != std::string::npos);
    assert(tracker.status().reassignments == 3);
}

} // namespace

int main() {
    test_progress_and_delivery();
    test_stale_and_foreign_events_are_dropped();
    test_retries_and_permanent_failures();
    test_stalled_gateways_and_reassignment();
    return 0;
}
