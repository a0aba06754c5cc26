#include "skyhop/region_graph.hpp"

#include "skyhop/errors.hpp"

#include <istream>
#include <sstream>

namespace skyhop {

namespace {

constexpr double bytes_per_megabyte = 1e6;

} // namespace

void RegionGraph::add_region(RegionNode node) {
    if (node.tag.empty()) {
        throw std::invalid_argument("region tag must be non-empty");
    }
    auto tag = node.tag;
    nodes_[tag] = std::move(node);
}

void RegionGraph::add_edge(Edge edge) {
    if (!has_region(edge.source) || !has_region(edge.destination)) {
        throw std::invalid_argument("edge " + edge.source + "->" + edge.destination + " references unknown region");
    }
    if (edge.source == edge.destination) {
        throw std::invalid_argument("self edge on " + edge.source);
    }
    if (edge.throughput_per_connection <= 0 || edge.cost_per_gb < 0) {
        throw std::invalid_argument("edge " + edge.source + "->" + edge.destination + " has invalid estimates");
    }
    auto source = edge.source;
    auto destination = edge.destination;
    edges_[source][destination] = std::move(edge);
}

bool RegionGraph::has_region(const RegionTag &tag) const { return nodes_.count(tag) != 0; }

const RegionNode &RegionGraph::region(const RegionTag &tag) const {
    auto it = nodes_.find(tag);
    if (it == nodes_.end()) {
        throw std::out_of_range("unknown region " + tag);
    }
    return it->second;
}

std::optional<Edge> RegionGraph::edge(const RegionTag &source, const RegionTag &destination) const {
    auto it = edges_.find(source);
    if (it == edges_.end()) {
        return std::nullopt;
    }
    auto jt = it->second.find(destination);
    if (jt == it->second.end()) {
        return std::nullopt;
    }
    return jt->second;
}

std::vector<Edge> RegionGraph::out_edges(const RegionTag &source) const {
    std::vector<Edge> result;
    auto it = edges_.find(source);
    if (it == edges_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto &entry : it->second) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<RegionTag> RegionGraph::regions() const {
    std::vector<RegionTag> tags;
    tags.reserve(nodes_.size());
    for (const auto &entry : nodes_) {
        tags.push_back(entry.first);
    }
    return tags;
}

std::size_t RegionGraph::edge_count() const {
    std::size_t count = 0;
    for (const auto &entry : edges_) {
        count += entry.second.size();
    }
    return count;
}

RegionGraph RegionGraph::parse(std::istream &in) {
    RegionGraph graph;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        std::istringstream fields(line);
        std::string kind;
        if (!(fields >> kind)) {
            continue;
        }
        try {
            if (kind == "region") {
                RegionNode node{};
                if (!(fields >> node.tag >> node.instance_limit)) {
                    throw ConfigError("expected: region <tag> <instance_limit>");
                }
                graph.add_region(std::move(node));
            } else if (kind == "edge") {
                Edge edge{};
                double megabytes_per_second = 0;
                if (!(fields >> edge.source >> edge.destination >> megabytes_per_second >> edge.cost_per_gb >>
                      edge.max_connections)) {
                    throw ConfigError("expected: edge <src> <dst> <throughput_MBps> <cost_per_gb> <max_connections>");
                }
                edge.throughput_per_connection = megabytes_per_second * bytes_per_megabyte;
                graph.add_edge(std::move(edge));
            } else {
                throw ConfigError("unknown record '" + kind + "'");
            }
        } catch (const std::logic_error &err) {
            throw ConfigError("region graph line " + std::to_string(line_number) + ": " + err.what());
        } catch (const ConfigError &err) {
            throw ConfigError("region graph line " + std::to_string(line_number) + ": " + err.what());
        }
    }
    return graph;
}

} // namespace skyhop
