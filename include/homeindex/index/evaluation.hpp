#pragma once

/** \file evaluation.hpp
 *  \brief Result of evaluating resolved predicates against one index.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "homeindex/property.hpp"

namespace homeindex::index {

/** \brief Work counters for one evaluation, used to compare both paths. */
struct EvalTrace {
    std::size_t keys_looked_up{0};     /**< attribute keys looked up in the index */
    std::size_t union_steps{0};        /**< ids emitted or inserted while unioning ranges */
    std::size_t intersect_steps{0};    /**< comparisons or membership checks while intersecting */
    std::size_t refined{0};            /**< ids checked against exact bucket bounds */
    bool short_circuited{false};       /**< a predicate matched nothing; later work skipped */
};

struct Evaluation {
    std::vector<PropertyId> ids;       /**< strictly ascending */
    EvalTrace trace;
};

/** \brief Build-time summary of one index. */
struct IndexStats {
    std::size_t num_properties{0};
    std::size_t posting_keys{0};        /**< distinct (attribute, key) pairs */
    std::size_t total_postings{0};      /**< sum of container sizes */
    std::int32_t max_bedrooms{0};
    double max_bathrooms{0.0};
    std::chrono::nanoseconds build_time{0};
};

} // namespace homeindex::index
