#pragma once

#include "skyhop/chunker.hpp"
#include "skyhop/planner.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace skyhop {

struct RetryPolicy {
    // Failures a chunk may accumulate before it fails permanently.
    std::uint32_t retry_budget = 3;
    std::chrono::milliseconds base_backoff{100};
    std::chrono::milliseconds max_backoff{5000};

    // Delay before the attempt that follows the `failures`-th failure.
    std::chrono::milliseconds backoff_for(std::uint32_t failures) const;
};

struct GatewayTuning {
    std::size_t stream_block_bytes = 1u << 20;
    // Capacity of each in-process relay pipe.
    std::size_t relay_buffer_bytes = 4u << 20;
    std::chrono::milliseconds heartbeat_interval{200};
    // Consecutive link failures, across at least two peers, that fence a
    // gateway.
    std::uint32_t link_failure_threshold = 8;
    // Longest wait for a single send or receive inside a frame.
    std::chrono::milliseconds io_timeout{30000};
    // Times a chunk goes back to Pending because its next hop is unreachable
    // before further failures count against its retry budget.
    std::uint32_t max_link_deferrals = 16;
};

struct TrackerConfig {
    std::chrono::milliseconds liveness_timeout{5000};
    std::chrono::milliseconds poll_interval{20};
    // Permanently failed chunks a job survives.
    std::size_t failure_tolerance = 0;
    std::uint32_t max_reassignments = 3;
    // Chunks handed to gateways ahead of completion; 0 means four per
    // source worker.
    std::size_t dispatch_window = 0;
    bool discard_partial_objects = true;
};

struct TransferConfig {
    ChunkPolicy chunking;
    RetryPolicy retry;
    GatewayTuning gateway;
    TrackerConfig tracker;
    PlanConstraints planning;

    // Throws ConfigError naming the first invalid setting.
    void validate() const;
};

struct ConfigArgs {
    TransferConfig config;
    // Options that are not transfer settings, keyed without the leading "--".
    std::map<std::string, std::string> options;
};

// Reads "--key value" pairs. Transfer settings land in `config`, anything else
// in `options`. A key without a value throws ConfigError.
ConfigArgs parse_config_args(int argc, char **argv);

} // namespace skyhop
