#include "homeindex/geo/proximity.hpp"
#include "homeindex/core/platform_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <numbers>
#include <queue>
#include <string>
#include <utility>

namespace homeindex::geo {

namespace {

constexpr double inf = std::numeric_limits<double>::infinity();

auto radians(double deg) noexcept -> double { return deg * std::numbers::pi / 180.0; }

auto geo_error(core::error_code code, std::string message, const char* component) -> core::error {
    return core::error{code, std::move(message), component};
}

} // namespace

auto haversine_km(double lat1, double lon1, double lat2, double lon2) noexcept -> double {
    const double p1 = radians(lat1);
    const double p2 = radians(lat2);
    const double dphi = p2 - p1;
    const double dl = radians(lon2 - lon1);
    const double s1 = std::sin(dphi / 2.0);
    const double s2 = std::sin(dl / 2.0);
    const double a = s1 * s1 + std::cos(p1) * std::cos(p2) * s2 * s2;
    // Rounding can push a a hair above 1 for antipodal points.
    return 2.0 * earth_radius_km * std::asin(std::sqrt(std::min(a, 1.0)));
}

auto valid_coordinates(double lat, double lon) noexcept -> bool {
    return std::isfinite(lat) && std::isfinite(lon) && lat >= -90.0 && lat <= 90.0 &&
           lon >= -180.0 && lon <= 180.0;
}

auto ShortestPaths::distance_km(PropertyId target) const noexcept -> double {
    return target < dist_.size() ? dist_[target] : inf;
}

auto ShortestPaths::reachable(PropertyId target) const noexcept -> bool {
    return distance_km(target) != inf;
}

auto ShortestPaths::path_to(PropertyId target) const -> std::vector<PropertyId> {
    std::vector<PropertyId> path;
    if (!reachable(target)) return path;
    for (std::int64_t at = target; at != no_prev; at = prev_[static_cast<std::size_t>(at)]) {
        path.push_back(static_cast<PropertyId>(at));
    }
    std::reverse(path.begin(), path.end());
    return path;
}

auto ShortestPaths::closest(std::size_t count) const
    -> std::vector<std::pair<PropertyId, double>> {
    std::vector<std::pair<PropertyId, double>> out;
    for (std::size_t i = 0; i < dist_.size(); ++i) {
        if (dist_[i] != inf) out.emplace_back(static_cast<PropertyId>(i), dist_[i]);
    }
    const auto by_distance = [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second < b.second : a.first < b.first;
    };
    const auto keep = std::min(count, out.size());
    std::partial_sort(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(keep), out.end(),
                      by_distance);
    out.resize(keep);
    return out;
}

auto ProximityGraph::build(const PropertyStore& store, std::size_t k)
    -> std::expected<ProximityGraph, core::error> {
    if (k == 0) {
        return std::unexpected(geo_error(core::error_code::invalid_argument,
                                         "k must be positive", "geo.proximity_graph"));
    }
    const auto t0 = std::chrono::steady_clock::now();

    ProximityGraph g;
    g.k_ = k;
    g.adjacency_.resize(store.size());
    g.lat_.resize(store.size(), 0.0);
    g.lon_.resize(store.size(), 0.0);
    for (const auto& p : store) {
        if (!valid_coordinates(p.latitude, p.longitude)) continue;
        g.nodes_.push_back(p.id);
        g.lat_[p.id] = p.latitude;
        g.lon_[p.id] = p.longitude;
    }

    // Max-heap on (km, id) keeps the k best candidates seen so far.
    using Candidate = std::pair<double, PropertyId>;
    std::vector<Candidate> heap;
    heap.reserve(k + 1);
    for (PropertyId u : g.nodes_) {
        heap.clear();
        for (PropertyId v : g.nodes_) {
            if (u == v) continue;
            const Candidate c{haversine_km(g.lat_[u], g.lon_[u], g.lat_[v], g.lon_[v]), v};
            if (heap.size() < k) {
                heap.push_back(c);
                std::push_heap(heap.begin(), heap.end());
            } else if (c < heap.front()) {
                std::pop_heap(heap.begin(), heap.end());
                heap.back() = c;
                std::push_heap(heap.begin(), heap.end());
            }
        }
        std::sort_heap(heap.begin(), heap.end());
        auto& edges = g.adjacency_[u];
        edges.reserve(heap.size());
        for (const auto& [km, v] : heap) edges.push_back(Neighbor{v, km});
    }

    if (core::debug_enabled()) {
        const auto ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[HOMEINDEX][geo] proximity graph nodes=" << g.nodes_.size()
                  << " skipped=" << store.size() - g.nodes_.size() << " k=" << k
                  << " ms=" << ms << "\n";
    }
    return g;
}

auto ProximityGraph::contains(PropertyId id) const noexcept -> bool {
    return std::binary_search(nodes_.begin(), nodes_.end(), id);
}

auto ProximityGraph::neighbors(PropertyId id) const noexcept -> std::span<const Neighbor> {
    if (id >= adjacency_.size()) return {};
    return adjacency_[id];
}

auto ProximityGraph::nearest(double lat, double lon) const
    -> std::expected<PropertyId, core::error> {
    if (!valid_coordinates(lat, lon)) {
        return std::unexpected(geo_error(core::error_code::invalid_argument,
                                         "coordinates out of range", "geo.nearest"));
    }
    if (nodes_.empty()) {
        return std::unexpected(geo_error(core::error_code::precondition_failed,
                                         "graph has no located properties", "geo.nearest"));
    }
    PropertyId best = nodes_.front();
    double best_km = inf;
    for (PropertyId id : nodes_) {
        const double d = haversine_km(lat, lon, lat_[id], lon_[id]);
        if (d < best_km) {
            best_km = d;
            best = id;
        }
    }
    return best;
}

auto ProximityGraph::shortest_paths(PropertyId source) const
    -> std::expected<ShortestPaths, core::error> {
    if (source >= adjacency_.size()) {
        return std::unexpected(geo_error(core::error_code::invalid_argument,
                                         "source id " + std::to_string(source) + " out of range",
                                         "geo.shortest_paths"));
    }
    if (!contains(source)) {
        return std::unexpected(geo_error(core::error_code::invalid_argument,
                                         "source id " + std::to_string(source) +
                                             " has no usable coordinates",
                                         "geo.shortest_paths"));
    }

    ShortestPaths out;
    out.source_ = source;
    out.dist_.assign(adjacency_.size(), inf);
    out.prev_.assign(adjacency_.size(), ShortestPaths::no_prev);
    out.dist_[source] = 0.0;

    using Entry = std::pair<double, PropertyId>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    frontier.emplace(0.0, source);
    while (!frontier.empty()) {
        const auto [du, u] = frontier.top();
        frontier.pop();
        if (du > out.dist_[u]) continue;   // stale entry
        for (const auto& edge : adjacency_[u]) {
            const double nd = du + edge.km;
            if (nd < out.dist_[edge.id]) {
                out.dist_[edge.id] = nd;
                out.prev_[edge.id] = u;
                frontier.emplace(nd, edge.id);
            }
        }
    }
    return out;
}

} // namespace homeindex::geo
