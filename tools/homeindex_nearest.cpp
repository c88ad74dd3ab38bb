// Builds a k-nearest proximity graph over a synthetic dataset, then prints the
// homes closest to a source by path distance and, optionally, the path to a target.

#include "homeindex/geo/proximity.hpp"
#include "homeindex/property.hpp"
#include "tests/support/dataset_generator.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using homeindex::PropertyId;
using homeindex::geo::ProximityGraph;
using homeindex::test::DatasetParams;

namespace {
struct Args {
    std::size_t n{2'000};
    std::uint32_t seed{42};
    std::size_t k{8};
    std::size_t top{10};
    std::optional<PropertyId> source;      // unset => nearest to --lat/--lon, else first node
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<PropertyId> target;
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "homeindex nearest\n"
              << "Usage: homeindex_nearest [--n=2000] [--seed=42] [--k=8] [--top=10]\n"
              << "  [--source=ID | --lat=DEG --lon=DEG] [--target=ID]\n"
              << "Environment: HOMEINDEX_DEBUG\n";
}
}

int main(int argc, char** argv) {
    Args args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (a == "--help" || a == "-h") { print_usage(); return 0; }
            else if (auto v = eat(a, "--n=")) args.n = static_cast<std::size_t>(std::stoull(*v));
            else if (auto v = eat(a, "--seed=")) args.seed = static_cast<std::uint32_t>(std::stoul(*v));
            else if (auto v = eat(a, "--k=")) args.k = static_cast<std::size_t>(std::stoull(*v));
            else if (auto v = eat(a, "--top=")) args.top = static_cast<std::size_t>(std::stoull(*v));
            else if (auto v = eat(a, "--source=")) args.source = static_cast<PropertyId>(std::stoul(*v));
            else if (auto v = eat(a, "--target=")) args.target = static_cast<PropertyId>(std::stoul(*v));
            else if (auto v = eat(a, "--lat=")) args.lat = std::stod(*v);
            else if (auto v = eat(a, "--lon=")) args.lon = std::stod(*v);
            else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << "\n";
        return 2;
    }
    if (args.lat.has_value() != args.lon.has_value()) {
        std::cerr << "--lat and --lon must be given together\n";
        return 2;
    }

    DatasetParams params;
    params.count = args.n;
    params.seed = args.seed;
    auto store = homeindex::PropertyStore::create(homeindex::test::generate_properties(params));
    if (!store) {
        std::cerr << "Dataset rejected: " << store.error().message << "\n";
        return 1;
    }

    auto graph = ProximityGraph::build(*store, args.k);
    if (!graph) {
        std::cerr << "Graph build failed: " << homeindex::core::to_string(graph.error().code)
                  << " " << graph.error().message << "\n";
        return 1;
    }
    if (graph->nodes().empty()) {
        std::cout << "no located properties\n";
        return 0;
    }

    PropertyId source = graph->nodes().front();
    if (args.source) {
        source = *args.source;
    } else if (args.lat) {
        auto near = graph->nearest(*args.lat, *args.lon);
        if (!near) {
            std::cerr << "Nearest lookup failed: " << near.error().message << "\n";
            return 2;
        }
        source = *near;
    }

    auto paths = graph->shortest_paths(source);
    if (!paths) {
        std::cerr << "Source invalid: " << paths.error().message << "\n";
        return 2;
    }

    std::cout << std::fixed << std::setprecision(3)
              << "nodes=" << graph->nodes().size() << " k=" << graph->k()
              << " source=" << source << "\n"
              << "nearest " << args.top << " by path distance (km):\n";
    for (const auto& [id, km] : paths->closest(args.top)) {
        std::cout << "id=" << id << " dist_km=" << km << "\n";
    }

    if (args.target) {
        if (!graph->contains(*args.target)) {
            std::cerr << "Target invalid: " << *args.target << "\n";
            return 2;
        }
        if (!paths->reachable(*args.target)) {
            std::cout << "target " << *args.target << " unreachable from " << source << "\n";
            return 0;
        }
        std::cout << "path_len_km=" << paths->distance_km(*args.target) << "\npath_ids:";
        for (PropertyId id : paths->path_to(*args.target)) std::cout << " " << id;
        std::cout << "\n";
    }
    return 0;
}
