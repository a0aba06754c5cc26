#include "skyhop/config.hpp"
#include "skyhop/errors.hpp"
#include "skyhop/network.hpp"
#include "skyhop/object_store.hpp"
#include "skyhop/planner.hpp"
#include "skyhop/provisioner.hpp"
#include "skyhop/region_graph.hpp"
#include "skyhop/transfer_service.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct PlanOptions {
    std::string graph;
    std::string source;
    std::vector<std::string> destinations;
    std::uint64_t bytes = 0;
};

struct CopyOptions {
    std::string graph;
    std::string source;
    std::vector<std::string> destinations;
    std::string source_root;
    std::vector<std::string> destination_roots;
    std::string prefix;
    std::string bind_address = "127.0.0.1";
};

void print_usage() {
    std::cerr << "Usage:\n"
                 "  skyhop plan --graph <file> --source <region> --destination <region>[,<region>...] --bytes <n>\n"
                 "              [options]\n"
                 "  skyhop copy --graph <file> --source <region> --destination <region>[,<region>...]\n"
                 "              --source-root <dir> --destination-root <dir>[,<dir>...] [--prefix <key prefix>]\n"
                 "              [--bind <address>] [options]\n"
                 "Options: --budget <dollars> --max-hops <n> --max-instances-per-region <n>\n"
                 "         --max-connections-per-edge <n> --connections-per-instance <n> --cost-weight <w>\n"
                 "         --chunk-bytes <n> --retry-budget <n> --failure-tolerance <n> --liveness-timeout-ms <n>\n";
}

std::string take(std::map<std::string, std::string> &options, const std::string &key, bool required) {
    auto it = options.find(key);
    if (it == options.end()) {
        if (required) {
            throw skyhop::ConfigError("missing --" + key + " option");
        }
        return {};
    }
    auto value = it->second;
    options.erase(it);
    return value;
}

// "a,b,c" -> {"a", "b", "c"}; empty items are an error.
std::vector<std::string> split_list(const std::string &option, const std::string &value) {
    std::vector<std::string> items;
    std::istringstream in(value);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (item.empty()) {
            throw skyhop::ConfigError("--" + option + " has an empty item in '" + value + "'");
        }
        items.push_back(item);
    }
    if (items.empty()) {
        throw skyhop::ConfigError("--" + option + " needs a value");
    }
    return items;
}

void reject_leftovers(const std::map<std::string, std::string> &options) {
    if (!options.empty()) {
        throw skyhop::ConfigError("unknown or incomplete option: --" + options.begin()->first);
    }
}

skyhop::RegionGraph load_graph(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw skyhop::ConfigError("cannot open region graph '" + path + "'");
    }
    return skyhop::RegionGraph::parse(in);
}

void run_plan(skyhop::ConfigArgs args) {
    PlanOptions opts;
    opts.graph = take(args.options, "graph", true);
    opts.source = take(args.options, "source", true);
    opts.destinations = split_list("destination", take(args.options, "destination", true));
    auto bytes = take(args.options, "bytes", true);
    reject_leftovers(args.options);
    try {
        opts.bytes = std::stoull(bytes);
    } catch (const std::logic_error &) {
        throw skyhop::ConfigError("--bytes expects an integer, got '" + bytes + "'");
    }
    args.config.validate();

    auto graph = load_graph(opts.graph);
    skyhop::TransferPlanner planner;
    std::vector<skyhop::Demand> demands;
    for (const auto &destination : opts.destinations) {
        demands.push_back(skyhop::Demand{opts.source, destination, opts.bytes});
    }
    auto plan = planner.plan(graph, demands, args.config.planning);
    std::cout << plan.to_document();
}

void run_copy(skyhop::ConfigArgs args) {
    CopyOptions opts;
    opts.graph = take(args.options, "graph", true);
    opts.source = take(args.options, "source", true);
    opts.destinations = split_list("destination", take(args.options, "destination", true));
    opts.source_root = take(args.options, "source-root", true);
    opts.destination_roots = split_list("destination-root", take(args.options, "destination-root", true));
    if (opts.destination_roots.size() != opts.destinations.size()) {
        throw skyhop::ConfigError("--destination-root needs one directory per destination");
    }
    opts.prefix = take(args.options, "prefix", false);
    auto bind = take(args.options, "bind", false);
    if (!bind.empty()) {
        opts.bind_address = bind;
    }
    reject_leftovers(args.options);

    auto graph = load_graph(opts.graph);
    std::map<skyhop::RegionTag, std::shared_ptr<skyhop::ObjectStore>> stores;
    stores[opts.source] = skyhop::make_object_store(skyhop::StoreConfig{"local", opts.source_root});
    std::vector<skyhop::PrefixDestination> targets;
    for (std::size_t i = 0; i < opts.destinations.size(); ++i) {
        stores[opts.destinations[i]] =
            skyhop::make_object_store(skyhop::StoreConfig{"local", opts.destination_roots[i]});
        targets.push_back(skyhop::PrefixDestination{opts.destinations[i], opts.prefix});
    }

    auto transport = std::make_shared<skyhop::TcpTransport>();
    auto provisioner = std::make_shared<skyhop::LocalProvisioner>(transport, opts.bind_address);
    skyhop::TransferService service(std::move(graph), args.config, std::move(stores), provisioner);

    auto job = service.submit_prefix(opts.source, opts.prefix, targets);
    std::cout << service.plan(job).to_document();

    while (true) {
        auto status = service.status(job);
        std::cout << "progress " << status.completed_bytes << "/" << status.total_bytes << " bytes, "
                  << status.completed_chunks << "/" << status.total_chunks << " chunks, " << status.in_flight_chunks
                  << " in flight";
        if (status.eta) {
            std::cout << ", eta " << std::fixed << std::setprecision(1) << status.eta->count() << "s";
        }
        std::cout << std::endl;
        if (status.state != skyhop::JobState::Running) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    auto result = service.wait(job);
    std::cout << "DONE objects=" << result.status.delivered_objects << " bytes=" << result.status.completed_bytes
              << " retries=" << result.status.retries << std::endl;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "plan") {
            run_plan(skyhop::parse_config_args(argc - 2, argv + 2));
        } else if (mode == "copy") {
            run_copy(skyhop::parse_config_args(argc - 2, argv + 2));
        } else if (mode == "--help" || mode == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            throw skyhop::ConfigError("unknown mode: " + mode);
        }
    } catch (const skyhop::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::invalid_argument &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
