#pragma once

#include "skyhop/types.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace skyhop {

struct RegionNode {
    RegionTag tag;
    std::uint32_t instance_limit;
};

struct Edge {
    RegionTag source;
    RegionTag destination;
    // bytes per second achieved by one connection
    double throughput_per_connection;
    double cost_per_gb;
    std::uint32_t max_connections;
};

// Directed graph of regions with per-edge throughput and egress cost
// estimates. Edges are sparse; a missing edge means no direct route.
class RegionGraph {
  public:
    void add_region(RegionNode node);

    void add_edge(Edge edge);

    bool has_region(const RegionTag &tag) const;

    const RegionNode &region(const RegionTag &tag) const;

    std::optional<Edge> edge(const RegionTag &source, const RegionTag &destination) const;

    // Edges leaving `source`, ordered by destination tag.
    std::vector<Edge> out_edges(const RegionTag &source) const;

    std::vector<RegionTag> regions() const;

    std::size_t edge_count() const;

    // Line format, '#' starts a comment:
    //   region <provider:location> <instance_limit>
    //   edge <src> <dst> <throughput_MBps> <cost_per_gb> <max_connections>
    static RegionGraph parse(std::istream &in);

  private:
    std::map<RegionTag, RegionNode> nodes_;
    std::map<RegionTag, std::map<RegionTag, Edge>> edges_;
};

} // namespace skyhop
