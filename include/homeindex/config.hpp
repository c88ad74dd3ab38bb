#pragma once

/** \file config.hpp
 *  \brief Build-time configuration shared by both indexes.
 *
 * Environment overrides (read by IndexConfig::from_env):
 * - HOMEINDEX_PRICE_BUCKET  positive integer, price bucket width
 * - HOMEINDEX_YEAR_BUCKET   positive integer, year_built bucket width
 * - HOMEINDEX_MERGE         "pairwise" | "heap"
 */

#include <cstdint>
#include <expected>
#include <string_view>

#include "homeindex/error.hpp"

namespace homeindex {

/** \brief Union algorithm used by the posting-list index for multi-key ranges. */
enum class merge_strategy : std::uint8_t {
    pairwise,   /**< balanced tree of linear two-way unions */
    heap        /**< single k-way merge driven by a min-heap */
};

auto to_string(merge_strategy m) noexcept -> std::string_view;

struct IndexConfig {
    std::int64_t price_bucket_width{50'000};  /**< currency units per price bucket */
    std::int64_t year_bucket_width{10};       /**< years per year_built bucket */
    merge_strategy merge{merge_strategy::pairwise};

    /** \brief Check widths are positive. */
    auto validate() const -> std::expected<void, core::error>;

    /** \brief Defaults overridden from the environment, validated. */
    static auto from_env() -> std::expected<IndexConfig, core::error>;

    /** \brief True when both configs bucket attributes identically. */
    auto same_buckets(const IndexConfig& other) const noexcept -> bool {
        return price_bucket_width == other.price_bucket_width &&
               year_bucket_width == other.year_bucket_width;
    }
};

} // namespace homeindex
