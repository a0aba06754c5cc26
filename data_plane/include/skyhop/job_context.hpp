#pragma once

#include "skyhop/config.hpp"
#include "skyhop/control_channel.hpp"
#include "skyhop/gateway_directory.hpp"
#include "skyhop/types.hpp"

#include <atomic>

namespace skyhop {

// State shared by everything working on one job. Gateways publish chunk events
// and heartbeats to `events`; the tracker is its only consumer.
struct JobContext {
    JobContext(JobId id, TransferConfig transfer_config) : job_id(id), config(std::move(transfer_config)) {}

    JobContext(const JobContext &) = delete;
    JobContext &operator=(const JobContext &) = delete;

    const JobId job_id;
    const TransferConfig config;
    ControlChannel events;
    GatewayDirectory directory;
    std::atomic<bool> cancelled{false};
};

} // namespace skyhop
