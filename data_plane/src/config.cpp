#include "skyhop/config.hpp"

#include "skyhop/errors.hpp"

#include <algorithm>
#include <sstream>

namespace skyhop {

namespace {

std::uint64_t parse_unsigned(const std::string &key, const std::string &value) {
    try {
        std::size_t used = 0;
        if (!value.empty() && value[0] == '-') {
            throw std::invalid_argument(value);
        }
        auto parsed = std::stoull(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error &) {
        throw ConfigError("option --" + key + " expects a non-negative integer, got '" + value + "'");
    }
}

double parse_double(const std::string &key, const std::string &value) {
    try {
        std::size_t used = 0;
        auto parsed = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error &) {
        throw ConfigError("option --" + key + " expects a number, got '" + value + "'");
    }
}

bool parse_bool(const std::string &key, const std::string &value) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw ConfigError("option --" + key + " expects true or false, got '" + value + "'");
}

std::chrono::milliseconds parse_millis(const std::string &key, const std::string &value) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(parse_unsigned(key, value)));
}

// Returns false when `key` is not a transfer setting.
bool apply(TransferConfig &config, const std::string &key, const std::string &value) {
    if (key == "chunk-bytes") {
        config.chunking.chunk_bytes = parse_unsigned(key, value);
    } else if (key == "min-chunk-bytes") {
        config.chunking.min_chunk_bytes = parse_unsigned(key, value);
    } else if (key == "max-chunk-bytes") {
        config.chunking.max_chunk_bytes = parse_unsigned(key, value);
    } else if (key == "whole-object-bytes") {
        config.chunking.whole_object_bytes = parse_unsigned(key, value);
    } else if (key == "retry-budget") {
        config.retry.retry_budget = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "base-backoff-ms") {
        config.retry.base_backoff = parse_millis(key, value);
    } else if (key == "max-backoff-ms") {
        config.retry.max_backoff = parse_millis(key, value);
    } else if (key == "stream-block-bytes") {
        config.gateway.stream_block_bytes = static_cast<std::size_t>(parse_unsigned(key, value));
    } else if (key == "relay-buffer-bytes") {
        config.gateway.relay_buffer_bytes = static_cast<std::size_t>(parse_unsigned(key, value));
    } else if (key == "heartbeat-ms") {
        config.gateway.heartbeat_interval = parse_millis(key, value);
    } else if (key == "link-failure-threshold") {
        config.gateway.link_failure_threshold = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "io-timeout-ms") {
        config.gateway.io_timeout = parse_millis(key, value);
    } else if (key == "max-link-deferrals") {
        config.gateway.max_link_deferrals = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "liveness-timeout-ms") {
        config.tracker.liveness_timeout = parse_millis(key, value);
    } else if (key == "failure-tolerance") {
        config.tracker.failure_tolerance = static_cast<std::size_t>(parse_unsigned(key, value));
    } else if (key == "max-reassignments") {
        config.tracker.max_reassignments = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "dispatch-window") {
        config.tracker.dispatch_window = static_cast<std::size_t>(parse_unsigned(key, value));
    } else if (key == "discard-partial") {
        config.tracker.discard_partial_objects = parse_bool(key, value);
    } else if (key == "budget") {
        config.planning.budget = parse_double(key, value);
    } else if (key == "max-instances-per-region") {
        config.planning.max_instances_per_region = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "max-connections-per-edge") {
        config.planning.max_connections_per_edge = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "connections-per-instance") {
        config.planning.connections_per_instance = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "max-hops") {
        config.planning.max_hops = static_cast<std::uint32_t>(parse_unsigned(key, value));
    } else if (key == "max-paths-per-pair") {
        config.planning.max_paths_per_pair = static_cast<std::size_t>(parse_unsigned(key, value));
    } else if (key == "exact-search-limit") {
        config.planning.exact_search_limit = parse_unsigned(key, value);
    } else if (key == "cost-weight") {
        config.planning.objective.cost_weight = parse_double(key, value);
    } else {
        return false;
    }
    return true;
}

} // namespace

std::chrono::milliseconds RetryPolicy::backoff_for(std::uint32_t failures) const {
    if (failures == 0) {
        return std::chrono::milliseconds(0);
    }
    auto delay = base_backoff;
    for (std::uint32_t i = 1; i < failures && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

void TransferConfig::validate() const {
    chunking.validate();
    if (retry.retry_budget == 0) {
        throw ConfigError("retry budget must be > 0");
    }
    if (retry.base_backoff.count() < 0 || retry.max_backoff < retry.base_backoff) {
        throw ConfigError("backoff must satisfy 0 <= base <= max");
    }
    if (gateway.stream_block_bytes == 0) {
        throw ConfigError("stream block size must be > 0");
    }
    if (gateway.relay_buffer_bytes < gateway.stream_block_bytes) {
        throw ConfigError("relay buffer must hold at least one stream block");
    }
    if (gateway.heartbeat_interval.count() <= 0) {
        throw ConfigError("heartbeat interval must be > 0");
    }
    if (gateway.link_failure_threshold == 0) {
        throw ConfigError("link failure threshold must be > 0");
    }
    if (gateway.io_timeout.count() <= 0) {
        throw ConfigError("I/O timeout must be > 0");
    }
    if (tracker.liveness_timeout <= gateway.heartbeat_interval) {
        throw ConfigError("liveness timeout must exceed the heartbeat interval");
    }
    if (tracker.poll_interval.count() <= 0) {
        throw ConfigError("tracker poll interval must be > 0");
    }
    if (planning.budget && *planning.budget < 0) {
        throw ConfigError("budget must be >= 0");
    }
    if (planning.max_instances_per_region == 0 || planning.max_connections_per_edge == 0 ||
        planning.connections_per_instance == 0) {
        throw ConfigError("instance and connection limits must be > 0");
    }
    if (planning.max_hops == 0 || planning.max_paths_per_pair == 0) {
        throw ConfigError("path search limits must be > 0");
    }
    if (planning.objective.cost_weight < 0) {
        throw ConfigError("cost weight must be >= 0");
    }
}

ConfigArgs parse_config_args(int argc, char **argv) {
    ConfigArgs args;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2 || i + 1 >= argc) {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw ConfigError(oss.str());
        }
        std::string key = arg.substr(2);
        std::string value = argv[++i];
        if (!apply(args.config, key, value)) {
            args.options[key] = value;
        }
    }
    return args;
}

} // namespace skyhop
