#pragma once

#include "skyhop/region_graph.hpp"
#include "skyhop/transfer_job.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace skyhop {

// Trade-off between throughput and egress spend. The planner maximises
//   throughput_GBps - cost_weight * spend_dollars_per_second
// subject to the budget; a weight of 0 maximises throughput alone.
struct PlanObjective {
    double cost_weight = 0.0;
};

struct PlanConstraints {
    // Ceiling on the estimated egress cost of the whole job, in dollars.
    std::optional<double> budget;
    std::uint32_t max_instances_per_region = 8;
    std::uint32_t max_connections_per_edge = 64;
    std::uint32_t connections_per_instance = 32;
    // Longest path considered, in edges. 2 allows one relay region.
    std::uint32_t max_hops = 2;
    std::size_t max_paths_per_pair = 16;
    // Integer assignments searched exhaustively before falling back to the
    // LP relaxation.
    std::uint64_t exact_search_limit = 100000;
    PlanObjective objective;
};

enum class PlanSolver { Exact, Relaxation, Greedy };

const char *to_string(PlanSolver solver);

struct PlannedPath {
    RegionTag source;
    RegionTag destination;
    std::vector<RegionTag> regions;
    std::uint32_t connections;
    double throughput_per_connection;
    double cost_per_gb;
};

struct PlannedEdge {
    RegionTag source;
    RegionTag destination;
    std::uint32_t connections;
};

struct PlannedRegion {
    RegionTag tag;
    std::uint32_t instances;
    std::uint32_t connections;
};

bool operator==(const PlannedPath &lhs, const PlannedPath &rhs);
bool operator==(const PlannedEdge &lhs, const PlannedEdge &rhs);
bool operator==(const PlannedRegion &lhs, const PlannedRegion &rhs);

struct TransferPlan {
    PlanSolver solver = PlanSolver::Greedy;
    // aggregate bytes per second across all pairs
    double throughput = 0;
    double estimated_cost = 0;
    double estimated_seconds = 0;
    std::vector<PlannedPath> paths;
    std::vector<PlannedEdge> edges;
    std::vector<PlannedRegion> regions;

    std::uint32_t instances(const RegionTag &region) const;

    std::uint32_t edge_connections(const RegionTag &source, const RegionTag &destination) const;

    std::vector<PlannedPath> paths_between(const RegionTag &source, const RegionTag &destination) const;

    // Text artifact handed to provisioning and to each gateway:
    //   plan <solver> <throughput> <cost> <seconds>
    //   path <src> <dst> <connections> <throughput_per_conn> <cost_per_gb> <r0,r1,...>
    //   edge <src> <dst> <connections>
    //   region <tag> <instances> <connections>
    std::string to_document() const;

    static TransferPlan parse(std::istream &in);
};

bool operator==(const TransferPlan &lhs, const TransferPlan &rhs);

class TransferPlanner {
  public:
    TransferPlan plan(const RegionGraph &graph, const TransferJob &job, const PlanConstraints &constraints) const;

    TransferPlan plan(const RegionGraph &graph, const std::vector<Demand> &demands,
                      const PlanConstraints &constraints) const;
};

} // namespace skyhop
