#pragma once

/** \file proximity.hpp
 *  \brief Nearest-neighbour graph over property coordinates and shortest
 *  path search between homes.
 *
 * Each property with usable coordinates becomes a node linked to its k
 * nearest other properties by great-circle distance. Edges are directed
 * (b being among a's k nearest does not imply the reverse). Properties with
 * non-finite or out-of-range coordinates are left out of the graph.
 *
 * Thread-safety: immutable after build(); shortest_paths() is const and safe
 * for concurrent calls.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "homeindex/error.hpp"
#include "homeindex/property.hpp"

namespace homeindex::geo {

/** \brief Mean Earth radius in kilometres (IUGG). */
inline constexpr double earth_radius_km = 6371.0088;

/** \brief Great-circle distance in kilometres between two lat/lon points in degrees. */
auto haversine_km(double lat1, double lon1, double lat2, double lon2) noexcept -> double;

/** \brief Finite latitude in [-90, 90] and longitude in [-180, 180]. */
auto valid_coordinates(double lat, double lon) noexcept -> bool;

/** \brief Outgoing edge of the proximity graph. */
struct Neighbor {
    PropertyId id{0};
    double km{0.0};
};

/** \brief Single-source result of shortest_paths().
 *
 * Indexed by PropertyId over the whole store. Properties outside the graph
 * or unreachable from the source have infinite distance.
 */
class ShortestPaths {
public:
    [[nodiscard]] auto source() const noexcept -> PropertyId { return source_; }

    /** \brief Path length in km; +inf when unreachable or id out of range. */
    [[nodiscard]] auto distance_km(PropertyId target) const noexcept -> double;

    [[nodiscard]] auto reachable(PropertyId target) const noexcept -> bool;

    /** \brief Ids from source to target inclusive; empty when unreachable. */
    [[nodiscard]] auto path_to(PropertyId target) const -> std::vector<PropertyId>;

    /** \brief Up to count reachable homes ordered by path distance, source first.
     *  Ties order by id.
     */
    [[nodiscard]] auto closest(std::size_t count) const
        -> std::vector<std::pair<PropertyId, double>>;

private:
    friend class ProximityGraph;

    static constexpr std::int64_t no_prev = -1;

    PropertyId source_{0};
    std::vector<double> dist_;
    std::vector<std::int64_t> prev_;
};

class ProximityGraph {
public:
    ProximityGraph() = default;

    /** \brief Link every located property to its k nearest located neighbours.
     *
     * \param store Records whose latitude/longitude are used
     * \param k Out-degree per node; fewer when the graph has k or fewer nodes
     * \return Graph, or invalid_argument when k is zero
     *
     * Complexity: O(V^2 log k) haversine evaluations and heap work.
     */
    static auto build(const PropertyStore& store, std::size_t k)
        -> std::expected<ProximityGraph, core::error>;

    /** \brief Located property closest to (lat, lon) by straight-line distance.
     *
     * \return id, invalid_argument for unusable coordinates, or
     *         precondition_failed when the graph has no nodes
     */
    auto nearest(double lat, double lon) const -> std::expected<PropertyId, core::error>;

    /** \brief Dijkstra over the graph from source.
     *
     * \return distances and predecessors, or invalid_argument when source is
     *         out of range or has no usable coordinates
     */
    auto shortest_paths(PropertyId source) const -> std::expected<ShortestPaths, core::error>;

    /** \brief Outgoing edges of id, nearest first; empty when id is not a node. */
    [[nodiscard]] auto neighbors(PropertyId id) const noexcept -> std::span<const Neighbor>;

    [[nodiscard]] auto contains(PropertyId id) const noexcept -> bool;

    /** \brief Ids of the graph's nodes, ascending. */
    [[nodiscard]] auto nodes() const noexcept -> std::span<const PropertyId> { return nodes_; }

    [[nodiscard]] auto k() const noexcept -> std::size_t { return k_; }
    [[nodiscard]] auto num_properties() const noexcept -> std::size_t { return adjacency_.size(); }

private:
    std::size_t k_{0};
    std::vector<PropertyId> nodes_;
    std::vector<std::vector<Neighbor>> adjacency_;   // by PropertyId
    std::vector<double> lat_;
    std::vector<double> lon_;
};

} // namespace homeindex::geo
