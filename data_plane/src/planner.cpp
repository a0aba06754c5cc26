#include "skyhop/planner.hpp"

#include "skyhop/errors.hpp"
#include "skyhop/lp_solver.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <istream>
#include <limits>
#include <map>
#include <sstream>

namespace skyhop {

namespace {

constexpr double bytes_per_gb = 1e9;
constexpr double tolerance = 1e-9;

struct Candidate {
    std::size_t pair;
    std::vector<RegionTag> regions;
    double throughput;
    double cost_per_gb;
    std::uint32_t capacity;
};

struct Problem {
    std::vector<Demand> demands;
    std::vector<Candidate> candidates;
    std::vector<std::uint32_t> edge_capacity;
    std::vector<std::vector<std::size_t>> edge_members;
    std::vector<std::uint32_t> region_capacity;
    std::vector<std::vector<std::size_t>> region_members;
    std::optional<double> budget;
    double cost_weight;
    std::uint32_t connections_per_instance;
};

struct Evaluation {
    bool feasible = false;
    double rate = 0;
    double throughput = 0;
    double cost = 0;
    double score = -std::numeric_limits<double>::infinity();
    std::size_t bottleneck_pairs = 0;
    std::uint64_t hops = 0;
    std::uint64_t connections = 0;
};

using Assignment = std::vector<std::uint32_t>;

double demand_bytes(const Demand &demand) { return std::max<double>(1.0, static_cast<double>(demand.bytes)); }

bool nearly_equal(double a, double b) {
    return std::fabs(a - b) <= tolerance * std::max({1.0, std::fabs(a), std::fabs(b)});
}

void enumerate_paths(const RegionGraph &graph, const RegionTag &target, std::uint32_t max_hops,
                     std::vector<RegionTag> &prefix, std::vector<std::vector<RegionTag>> &out) {
    const auto &tail = prefix.back();
    if (tail == target) {
        out.push_back(prefix);
        return;
    }
    if (prefix.size() > max_hops) {
        return;
    }
    for (const auto &edge : graph.out_edges(tail)) {
        if (std::find(prefix.begin(), prefix.end(), edge.destination) != prefix.end()) {
            continue;
        }
        prefix.push_back(edge.destination);
        enumerate_paths(graph, target, max_hops, prefix, out);
        prefix.pop_back();
    }
}

std::vector<Candidate> candidate_paths(const RegionGraph &graph, std::size_t pair, const Demand &demand,
                                       const PlanConstraints &constraints) {
    std::vector<std::vector<RegionTag>> paths;
    std::vector<RegionTag> prefix{demand.source};
    if (constraints.max_hops > 0 && graph.has_region(demand.source) && graph.has_region(demand.destination)) {
        enumerate_paths(graph, demand.destination, constraints.max_hops, prefix, paths);
    }

    std::vector<Candidate> candidates;
    for (auto &regions : paths) {
        Candidate candidate{pair, std::move(regions), std::numeric_limits<double>::infinity(), 0.0,
                            constraints.max_connections_per_edge};
        for (std::size_t i = 0; i + 1 < candidate.regions.size(); ++i) {
            auto edge = graph.edge(candidate.regions[i], candidate.regions[i + 1]);
            candidate.throughput = std::min(candidate.throughput, edge->throughput_per_connection);
            candidate.cost_per_gb += edge->cost_per_gb;
            candidate.capacity = std::min(candidate.capacity, edge->max_connections);
        }
        if (candidate.capacity > 0) {
            candidates.push_back(std::move(candidate));
        }
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b) {
        if (a.cost_per_gb != b.cost_per_gb) {
            return a.cost_per_gb < b.cost_per_gb;
        }
        if (a.regions.size() != b.regions.size()) {
            return a.regions.size() < b.regions.size();
        }
        return a.regions < b.regions;
    });
    if (candidates.size() > constraints.max_paths_per_pair) {
        candidates.resize(constraints.max_paths_per_pair);
    }
    return candidates;
}

Problem build_problem(const RegionGraph &graph, const std::vector<Demand> &demands,
                      const PlanConstraints &constraints, std::vector<RegionPair> &unreachable) {
    Problem problem;
    problem.demands = demands;
    problem.budget = constraints.budget;
    problem.cost_weight = constraints.objective.cost_weight;
    problem.connections_per_instance = constraints.connections_per_instance;

    for (std::size_t k = 0; k < demands.size(); ++k) {
        auto candidates = candidate_paths(graph, k, demands[k], constraints);
        if (candidates.empty()) {
            unreachable.push_back(RegionPair{demands[k].source, demands[k].destination});
        }
        for (auto &candidate : candidates) {
            problem.candidates.push_back(std::move(candidate));
        }
    }

    std::map<std::pair<RegionTag, RegionTag>, std::size_t> edge_index;
    std::map<RegionTag, std::size_t> region_index;
    for (std::size_t p = 0; p < problem.candidates.size(); ++p) {
        const auto &regions = problem.candidates[p].regions;
        for (std::size_t i = 0; i + 1 < regions.size(); ++i) {
            auto key = std::make_pair(regions[i], regions[i + 1]);
            auto it = edge_index.find(key);
            if (it == edge_index.end()) {
                auto edge = graph.edge(regions[i], regions[i + 1]);
                it = edge_index.emplace(key, problem.edge_capacity.size()).first;
                problem.edge_capacity.push_back(std::min(edge->max_connections, constraints.max_connections_per_edge));
                problem.edge_members.emplace_back();
            }
            problem.edge_members[it->second].push_back(p);
        }
        for (const auto &region : regions) {
            auto it = region_index.find(region);
            if (it == region_index.end()) {
                auto instances = std::min(graph.region(region).instance_limit, constraints.max_instances_per_region);
                it = region_index.emplace(region, problem.region_capacity.size()).first;
                problem.region_capacity.push_back(instances * constraints.connections_per_instance);
                problem.region_members.emplace_back();
            }
            problem.region_members[it->second].push_back(p);
        }
    }
    for (std::size_t r = 0; r < problem.region_members.size(); ++r) {
        for (auto p : problem.region_members[r]) {
            auto &candidate = problem.candidates[p];
            candidate.capacity = std::min(candidate.capacity, problem.region_capacity[r]);
        }
    }
    return problem;
}

bool within_capacity(const Problem &problem, const Assignment &x) {
    for (std::size_t e = 0; e < problem.edge_members.size(); ++e) {
        std::uint64_t used = 0;
        for (auto p : problem.edge_members[e]) {
            used += x[p];
        }
        if (used > problem.edge_capacity[e]) {
            return false;
        }
    }
    for (std::size_t r = 0; r < problem.region_members.size(); ++r) {
        std::uint64_t used = 0;
        for (auto p : problem.region_members[r]) {
            used += x[p];
        }
        if (used > problem.region_capacity[r]) {
            return false;
        }
    }
    return true;
}

Evaluation evaluate(const Problem &problem, const Assignment &x) {
    Evaluation result;
    if (!within_capacity(problem, x)) {
        return result;
    }
    std::vector<double> pair_throughput(problem.demands.size(), 0.0);
    for (std::size_t p = 0; p < problem.candidates.size(); ++p) {
        const auto &candidate = problem.candidates[p];
        pair_throughput[candidate.pair] += candidate.throughput * x[p];
        if (x[p] > 0) {
            result.hops += candidate.regions.size() - 1;
            result.connections += x[p];
        }
    }
    double rate = std::numeric_limits<double>::infinity();
    double total_bytes = 0;
    for (std::size_t k = 0; k < problem.demands.size(); ++k) {
        if (pair_throughput[k] <= 0) {
            return result;
        }
        rate = std::min(rate, pair_throughput[k] / demand_bytes(problem.demands[k]));
        total_bytes += demand_bytes(problem.demands[k]);
    }
    for (std::size_t k = 0; k < problem.demands.size(); ++k) {
        if (nearly_equal(pair_throughput[k] / demand_bytes(problem.demands[k]), rate)) {
            ++result.bottleneck_pairs;
        }
    }
    // Each pair's bytes split across its paths in proportion to their throughput.
    double cost = 0;
    for (std::size_t p = 0; p < problem.candidates.size(); ++p) {
        const auto &candidate = problem.candidates[p];
        if (x[p] == 0) {
            continue;
        }
        double share = candidate.throughput * x[p] / pair_throughput[candidate.pair];
        cost += candidate.cost_per_gb * share * demand_bytes(problem.demands[candidate.pair]) / bytes_per_gb;
    }
    if (problem.budget && cost > *problem.budget * (1 + tolerance)) {
        return result;
    }
    result.feasible = true;
    result.rate = rate;
    result.throughput = rate * total_bytes;
    result.cost = cost;
    result.score = result.throughput / bytes_per_gb - problem.cost_weight * cost * rate;
    return result;
}

std::vector<const std::vector<RegionTag> *> used_paths(const Problem &problem, const Assignment &x) {
    std::vector<const std::vector<RegionTag> *> used;
    for (std::size_t p = 0; p < x.size(); ++p) {
        if (x[p] > 0) {
            used.push_back(&problem.candidates[p].regions);
        }
    }
    return used;
}

// Strict preference: higher score, then lower cost, fewer hops, fewer
// connections, lexicographically smaller paths.
bool better(const Problem &problem, const Evaluation &a, const Assignment &xa, const Evaluation &b,
            const Assignment &xb) {
    if (a.feasible != b.feasible) {
        return a.feasible;
    }
    if (!a.feasible) {
        return false;
    }
    if (!nearly_equal(a.score, b.score)) {
        return a.score > b.score;
    }
    if (!nearly_equal(a.cost, b.cost)) {
        return a.cost < b.cost;
    }
    if (a.hops != b.hops) {
        return a.hops < b.hops;
    }
    if (a.connections != b.connections) {
        return a.connections < b.connections;
    }
    auto pa = used_paths(problem, xa);
    auto pb = used_paths(problem, xb);
    bool path_less = std::lexicographical_compare(pa.begin(), pa.end(), pb.begin(), pb.end(),
                                                  [](const auto *l, const auto *r) { return *l < *r; });
    bool path_greater = std::lexicographical_compare(pb.begin(), pb.end(), pa.begin(), pa.end(),
                                                     [](const auto *l, const auto *r) { return *l < *r; });
    if (path_less || path_greater) {
        return path_less;
    }
    return xa < xb;
}

std::uint64_t search_space(const Problem &problem, std::uint64_t limit) {
    std::uint64_t size = 1;
    for (const auto &candidate : problem.candidates) {
        std::uint64_t options = static_cast<std::uint64_t>(candidate.capacity) + 1;
        if (size > limit / options) {
            return limit + 1;
        }
        size *= options;
    }
    return size;
}

void exact_search(const Problem &problem, std::size_t index, Assignment &x, Assignment &best,
                  Evaluation &best_eval) {
    if (index == x.size()) {
        auto eval = evaluate(problem, x);
        if (better(problem, eval, x, best_eval, best)) {
            best = x;
            best_eval = eval;
        }
        return;
    }
    for (std::uint32_t n = 0; n <= problem.candidates[index].capacity; ++n) {
        x[index] = n;
        if (!within_capacity(problem, x)) {
            break;
        }
        exact_search(problem, index + 1, x, best, best_eval);
    }
    x[index] = 0;
}

// Adds one connection at a time while that strictly improves the plan, or
// lifts one of several pairs tied at the bottleneck.
void augment(const Problem &problem, Assignment &x) {
    auto current = evaluate(problem, x);
    while (true) {
        bool found = false;
        Evaluation chosen_eval;
        Assignment chosen_x;
        for (std::size_t p = 0; p < x.size(); ++p) {
            if (x[p] >= problem.candidates[p].capacity) {
                continue;
            }
            ++x[p];
            auto eval = evaluate(problem, x);
            bool progress = eval.feasible &&
                            (!current.feasible || (eval.score > current.score && !nearly_equal(eval.score, current.score)) ||
                             (nearly_equal(eval.score, current.score) && eval.bottleneck_pairs < current.bottleneck_pairs));
            if (progress && (!found || better(problem, eval, x, chosen_eval, chosen_x))) {
                found = true;
                chosen_eval = eval;
                chosen_x = x;
            }
            --x[p];
        }
        if (!found) {
            return;
        }
        x = std::move(chosen_x);
        current = chosen_eval;
    }
}

Assignment greedy(const Problem &problem) {
    Assignment x(problem.candidates.size(), 0);
    for (std::size_t k = 0; k < problem.demands.size(); ++k) {
        for (std::size_t p = 0; p < problem.candidates.size(); ++p) {
            if (problem.candidates[p].pair != k) {
                continue;
            }
            x[p] = 1;
            if (within_capacity(problem, x)) {
                break;
            }
            x[p] = 0;
        }
    }
    augment(problem, x);
    return x;
}

std::optional<Assignment> relaxation(const Problem &problem) {
    const std::size_t paths = problem.candidates.size();
    const std::size_t rate_var = paths;
    LinearProgram lp(paths + 1);

    double total_gb = 0;
    for (const auto &demand : problem.demands) {
        total_gb += demand_bytes(demand) / bytes_per_gb;
    }
    lp.set_objective(rate_var, total_gb);
    for (std::size_t p = 0; p < paths; ++p) {
        const auto &candidate = problem.candidates[p];
        lp.set_objective(p, -problem.cost_weight * candidate.cost_per_gb * candidate.throughput / bytes_per_gb);
    }

    for (std::size_t k = 0; k < problem.demands.size(); ++k) {
        std::vector<double> row(paths + 1, 0.0);
        for (std::size_t p = 0; p < paths; ++p) {
            if (problem.candidates[p].pair == k) {
                row[p] = -problem.candidates[p].throughput / bytes_per_gb;
            }
        }
        row[rate_var] = demand_bytes(problem.demands[k]) / bytes_per_gb;
        lp.add_constraint(std::move(row), 0.0);
    }
    if (problem.budget) {
        std::vector<double> row(paths + 1, 0.0);
        for (std::size_t p = 0; p < paths; ++p) {
            const auto &candidate = problem.candidates[p];
            row[p] = candidate.cost_per_gb * candidate.throughput / bytes_per_gb;
        }
        row[rate_var] = -*problem.budget;
        lp.add_constraint(std::move(row), 0.0);
    }
    auto add_capacity_rows = [&](const std::vector<std::vector<std::size_t>> &members,
                                 const std::vector<std::uint32_t> &capacity) {
        for (std::size_t i = 0; i < members.size(); ++i) {
            std::vector<double> row(paths + 1, 0.0);
            for (auto p : members[i]) {
                row[p] = 1.0;
            }
            lp.add_constraint(std::move(row), capacity[i]);
        }
    };
    add_capacity_rows(problem.edge_members, problem.edge_capacity);
    add_capacity_rows(problem.region_members, problem.region_capacity);

    auto solution = lp.solve();
    if (solution.status != LinearProgram::Status::Optimal) {
        return std::nullopt;
    }
    Assignment x(paths, 0);
    for (std::size_t p = 0; p < paths; ++p) {
        x[p] = static_cast<std::uint32_t>(std::floor(solution.values[p] + 1e-7));
    }
    if (!evaluate(problem, x).feasible) {
        return std::nullopt;
    }
    augment(problem, x);
    return x;
}

std::vector<RegionPair> over_budget_pairs(const Problem &problem) {
    std::vector<RegionPair> pairs;
    for (std::size_t k = 0; k < problem.demands.size(); ++k) {
        double cheapest = std::numeric_limits<double>::infinity();
        for (const auto &candidate : problem.candidates) {
            if (candidate.pair == k) {
                cheapest = std::min(cheapest, candidate.cost_per_gb);
            }
        }
        if (problem.budget && cheapest * demand_bytes(problem.demands[k]) / bytes_per_gb > *problem.budget) {
            pairs.push_back(RegionPair{problem.demands[k].source, problem.demands[k].destination});
        }
    }
    if (pairs.empty()) {
        for (const auto &demand : problem.demands) {
            pairs.push_back(RegionPair{demand.source, demand.destination});
        }
    }
    return pairs;
}

TransferPlan build_plan(const Problem &problem, const Assignment &x, const Evaluation &eval, PlanSolver solver) {
    TransferPlan plan;
    plan.solver = solver;
    plan.throughput = eval.throughput;
    plan.estimated_cost = eval.cost;
    plan.estimated_seconds = eval.rate > 0 ? 1.0 / eval.rate : 0.0;

    std::map<std::pair<RegionTag, RegionTag>, std::uint32_t> edges;
    std::map<RegionTag, std::uint32_t> regions;
    for (std::size_t p = 0; p < x.size(); ++p) {
        if (x[p] == 0) {
            continue;
        }
        const auto &candidate = problem.candidates[p];
        const auto &demand = problem.demands[candidate.pair];
        plan.paths.push_back(PlannedPath{demand.source, demand.destination, candidate.regions, x[p],
                                         candidate.throughput, candidate.cost_per_gb});
        for (std::size_t i = 0; i + 1 < candidate.regions.size(); ++i) {
            edges[{candidate.regions[i], candidate.regions[i + 1]}] += x[p];
        }
        for (const auto &region : candidate.regions) {
            regions[region] += x[p];
        }
    }
    for (const auto &entry : edges) {
        plan.edges.push_back(PlannedEdge{entry.first.first, entry.first.second, entry.second});
    }
    for (const auto &entry : regions) {
        std::uint32_t per_instance = std::max<std::uint32_t>(1, problem.connections_per_instance);
        std::uint32_t instances = std::max<std::uint32_t>(1, (entry.second + per_instance - 1) / per_instance);
        plan.regions.push_back(PlannedRegion{entry.first, instances, entry.second});
    }
    return plan;
}

std::string join_regions(const std::vector<RegionTag> &regions) {
    std::string joined;
    for (const auto &region : regions) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += region;
    }
    return joined;
}

std::vector<RegionTag> split_regions(const std::string &joined) {
    std::vector<RegionTag> regions;
    std::istringstream in(joined);
    std::string region;
    while (std::getline(in, region, ',')) {
        regions.push_back(region);
    }
    return regions;
}

PlanSolver parse_solver(const std::string &name) {
    for (auto solver : {PlanSolver::Exact, PlanSolver::Relaxation, PlanSolver::Greedy}) {
        if (name == to_string(solver)) {
            return solver;
        }
    }
    throw ConfigError("unknown plan solver: " + name);
}

} // namespace

const char *to_string(PlanSolver solver) {
    switch (solver) {
    case PlanSolver::Exact:
        return "exact";
    case PlanSolver::Relaxation:
        return "relaxation";
    case PlanSolver::Greedy:
        return "greedy";
    }
    return "unknown";
}

bool operator==(const PlannedPath &lhs, const PlannedPath &rhs) {
    return lhs.source == rhs.source && lhs.destination == rhs.destination && lhs.regions == rhs.regions &&
           lhs.connections == rhs.connections && lhs.throughput_per_connection == rhs.throughput_per_connection &&
           lhs.cost_per_gb == rhs.cost_per_gb;
}

bool operator==(const PlannedEdge &lhs, const PlannedEdge &rhs) {
    return lhs.source == rhs.source && lhs.destination == rhs.destination && lhs.connections == rhs.connections;
}

bool operator==(const PlannedRegion &lhs, const PlannedRegion &rhs) {
    return lhs.tag == rhs.tag && lhs.instances == rhs.instances && lhs.connections == rhs.connections;
}

bool operator==(const TransferPlan &lhs, const TransferPlan &rhs) {
    return lhs.solver == rhs.solver && lhs.throughput == rhs.throughput &&
           lhs.estimated_cost == rhs.estimated_cost && lhs.estimated_seconds == rhs.estimated_seconds &&
           lhs.paths == rhs.paths && lhs.edges == rhs.edges && lhs.regions == rhs.regions;
}

std::uint32_t TransferPlan::instances(const RegionTag &region) const {
    for (const auto &planned : regions) {
        if (planned.tag == region) {
            return planned.instances;
        }
    }
    return 0;
}

std::uint32_t TransferPlan::edge_connections(const RegionTag &source, const RegionTag &destination) const {
    for (const auto &edge : edges) {
        if (edge.source == source && edge.destination == destination) {
            return edge.connections;
        }
    }
    return 0;
}

std::vector<PlannedPath> TransferPlan::paths_between(const RegionTag &source, const RegionTag &destination) const {
    std::vector<PlannedPath> result;
    for (const auto &path : paths) {
        if (path.source == source && path.destination == destination) {
            result.push_back(path);
        }
    }
    return result;
}

std::string TransferPlan::to_document() const {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << "plan " << to_string(solver) << ' ' << throughput << ' ' << estimated_cost << ' ' << estimated_seconds
        << '\n';
    for (const auto &path : paths) {
        oss << "path " << path.source << ' ' << path.destination << ' ' << path.connections << ' '
            << path.throughput_per_connection << ' ' << path.cost_per_gb << ' ' << join_regions(path.regions) << '\n';
    }
    for (const auto &edge : edges) {
        oss << "edge " << edge.source << ' ' << edge.destination << ' ' << edge.connections << '\n';
    }
    for (const auto &region : regions) {
        oss << "region " << region.tag << ' ' << region.instances << ' ' << region.connections << '\n';
    }
    return oss.str();
}

TransferPlan TransferPlan::parse(std::istream &in) {
    TransferPlan plan;
    bool header = false;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string kind;
        if (!(fields >> kind)) {
            continue;
        }
        bool ok = true;
        if (kind == "plan") {
            std::string solver;
            ok = static_cast<bool>(fields >> solver >> plan.throughput >> plan.estimated_cost >> plan.estimated_seconds);
            if (ok) {
                plan.solver = parse_solver(solver);
                header = true;
            }
        } else if (kind == "path") {
            PlannedPath path;
            std::string regions;
            ok = static_cast<bool>(fields >> path.source >> path.destination >> path.connections >>
                                   path.throughput_per_connection >> path.cost_per_gb >> regions);
            path.regions = split_regions(regions);
            plan.paths.push_back(std::move(path));
        } else if (kind == "edge") {
            PlannedEdge edge;
            ok = static_cast<bool>(fields >> edge.source >> edge.destination >> edge.connections);
            plan.edges.push_back(std::move(edge));
        } else if (kind == "region") {
            PlannedRegion region;
            ok = static_cast<bool>(fields >> region.tag >> region.instances >> region.connections);
            plan.regions.push_back(std::move(region));
        } else {
            throw ConfigError("unknown plan record '" + kind + "'");
        }
        if (!ok) {
            throw ConfigError("malformed plan record: " + line);
        }
    }
    if (!header) {
        throw ConfigError("plan document has no header");
    }
    return plan;
}

TransferPlan TransferPlanner::plan(const RegionGraph &graph, const TransferJob &job,
                                   const PlanConstraints &constraints) const {
    return plan(graph, job.demands(), constraints);
}

TransferPlan TransferPlanner::plan(const RegionGraph &graph, const std::vector<Demand> &demands,
                                   const PlanConstraints &constraints) const {
    if (demands.empty()) {
        throw std::invalid_argument("nothing to plan: no demand pairs");
    }
    if (constraints.connections_per_instance == 0) {
        throw std::invalid_argument("connections_per_instance must be > 0");
    }
    std::vector<RegionPair> unreachable;
    auto problem = build_problem(graph, demands, constraints, unreachable);
    if (!unreachable.empty()) {
        throw PlanningInfeasible(std::move(unreachable));
    }

    Assignment x;
    PlanSolver solver;
    if (search_space(problem, constraints.exact_search_limit) <= constraints.exact_search_limit) {
        Assignment scratch(problem.candidates.size(), 0);
        x = scratch;
        Evaluation best_eval;
        exact_search(problem, 0, scratch, x, best_eval);
        solver = PlanSolver::Exact;
    } else if (auto rounded = relaxation(problem)) {
        x = std::move(*rounded);
        solver = PlanSolver::Relaxation;
    } else {
        x = greedy(problem);
        solver = PlanSolver::Greedy;
    }

    auto eval = evaluate(problem, x);
    if (!eval.feasible) {
        throw PlanningInfeasible(over_budget_pairs(problem));
    }
    return build_plan(problem, x, eval, solver);
}

} // namespace skyhop
