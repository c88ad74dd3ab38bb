#pragma once

/** \file attribute.hpp
 *  \brief Indexed attribute schema, key projection and predicate resolution.
 *
 * Every indexed attribute projects a Property onto a signed 64-bit key:
 *   bedrooms      count
 *   bathrooms     half-bath count (bathrooms * 2)
 *   price         price / price_bucket_width
 *   year_built    year_built / year_bucket_width
 *   has_*         0 or 1
 * Range predicates resolve to an inclusive key interval; for bucketed
 * attributes whose bounds cut through a bucket, exact refinement bounds
 * are attached so indexes can drop boundary false positives.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

#include "homeindex/config.hpp"
#include "homeindex/error.hpp"
#include "homeindex/filter_expr.hpp"
#include "homeindex/property.hpp"

namespace homeindex {

enum class Attribute : std::uint8_t {
    bedrooms,
    bathrooms,
    price,
    year_built,
    has_basement,
    has_fireplace,
    has_attic,
    has_garage,
};

inline constexpr std::size_t attribute_count = 8;

inline constexpr std::array<Attribute, attribute_count> all_attributes{
    Attribute::bedrooms,     Attribute::bathrooms,     Attribute::price,
    Attribute::year_built,   Attribute::has_basement,  Attribute::has_fireplace,
    Attribute::has_attic,    Attribute::has_garage,
};

enum class AttributeKind : std::uint8_t {
    discrete,   /**< integral value is the key */
    half_step,  /**< value * 2 is the key */
    bucketed,   /**< value / width is the key */
    flag,       /**< bool as 0/1 */
};

using AttributeKey = std::int64_t;

constexpr auto attribute_index(Attribute a) noexcept -> std::size_t {
    return static_cast<std::size_t>(a);
}

auto attribute_name(Attribute a) noexcept -> std::string_view;
auto attribute_from_name(std::string_view name) noexcept -> std::optional<Attribute>;
auto attribute_kind(Attribute a) noexcept -> AttributeKind;

/** \brief Key of property p under attribute a. */
auto attribute_key(const Property& p, Attribute a, const IndexConfig& cfg) noexcept -> AttributeKey;

/** \brief Raw integral value behind a bucketed attribute (price, year_built). */
auto bucketed_value(const Property& p, Attribute a) noexcept -> std::int64_t;

/** \brief One predicate after validation: an inclusive key interval. */
struct KeyRange {
    Attribute attribute{Attribute::bedrooms};
    AttributeKey first{0};  /**< inclusive */
    AttributeKey last{0};   /**< inclusive; first > last means nothing can match */

    /** \brief Exact inclusive value bounds for bucketed attributes when the
     *  interval cuts through a bucket edge. */
    struct Refinement {
        std::int64_t min_value;
        std::int64_t max_value;
    };
    std::optional<Refinement> refine;

    auto empty() const noexcept -> bool { return first > last; }
    auto single_key() const noexcept -> bool { return first == last; }
};

/** \brief Validate a filter and resolve it into key intervals.
 *
 * Errors (raised before any index is consulted):
 * - unknown_attribute: predicate or flag names a non-indexed field
 * - invalid_range: min > max, non-numeric bound, NaN bound, range on a flag
 * - invalid_argument: exact value whose type does not fit the attribute
 *
 * Output order follows the filter: predicates first, then required flags.
 */
auto resolve_filter(const query_filter& filter, const IndexConfig& cfg)
    -> std::expected<std::vector<KeyRange>, core::error>;

} // namespace homeindex
