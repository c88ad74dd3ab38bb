#pragma once

/** \file query_planner.hpp
 *  \brief Validates a filter, runs it through both indexes, times and compares them.
 *
 * Thread-safety: query() is const and may be called concurrently; the
 * referenced store and indexes must outlive the planner and stay unmodified.
 * Counters in PlannerStats are updated atomically.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

#include "homeindex/error.hpp"
#include "homeindex/filter_expr.hpp"
#include "homeindex/index/evaluation.hpp"
#include "homeindex/index/hash_set_index.hpp"
#include "homeindex/index/posting_list_index.hpp"
#include "homeindex/index_set.hpp"
#include "homeindex/property.hpp"

namespace homeindex::search {

/** \brief Which index paths a query runs through. */
enum class evaluation_mode : std::uint8_t {
    both,               /**< run both and require identical ids */
    hash_set_only,
    posting_list_only,
};

struct QueryOptions {
    evaluation_mode mode{evaluation_mode::both};
    std::size_t hydrate_limit{0};   /**< max Property records copied out; 0 = all */
};

/** \brief Outcome of one query. Durations cover index evaluation only. */
struct QueryResult {
    std::vector<PropertyId> ids;                    /**< ascending, complete */
    std::vector<Property> properties;               /**< records for ids, in id order */
    std::chrono::nanoseconds hash_set_elapsed{0};   /**< zero when the path did not run */
    std::chrono::nanoseconds posting_list_elapsed{0};
    index::EvalTrace hash_set_trace;
    index::EvalTrace posting_list_trace;

    auto hash_set_ms() const noexcept -> double {
        return std::chrono::duration<double, std::milli>(hash_set_elapsed).count();
    }
    auto posting_list_ms() const noexcept -> double {
        return std::chrono::duration<double, std::milli>(posting_list_elapsed).count();
    }
};

struct PlannerStats {
    std::uint64_t queries_executed{0};    /**< queries that produced a result */
    std::uint64_t queries_rejected{0};    /**< caller errors caught during validation */
    std::uint64_t mismatches{0};          /**< both paths disagreed */
    std::chrono::nanoseconds hash_set_time{0};
    std::chrono::nanoseconds posting_list_time{0};
};

class QueryPlanner {
public:
    explicit QueryPlanner(const IndexSet& set);
    QueryPlanner(const PropertyStore& store,
                 const index::HashSetIndex& hash_set,
                 const index::PostingListIndex& posting_list);
    ~QueryPlanner();
    QueryPlanner(const QueryPlanner&) = delete;
    QueryPlanner& operator=(const QueryPlanner&) = delete;

    /** \brief Evaluate a conjunctive filter.
     *
     * \param filter Predicates and required flags; empty matches everything
     * \param options Paths to run and hydration cap
     * \return Result, or
     *   - unknown_attribute / invalid_range / invalid_argument for bad filters
     *     (neither index is touched),
     *   - config_invalid when the indexes bucket differently,
     *   - precondition_failed when an index was built over a different record count,
     *   - result_mismatch when the two paths disagree.
     */
    auto query(const query_filter& filter, const QueryOptions& options = {}) const
        -> std::expected<QueryResult, core::error>;

    auto get_stats() const -> PlannerStats;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief One-shot query without a long-lived planner. */
auto query(const query_filter& filter,
           const index::HashSetIndex& hash_set,
           const index::PostingListIndex& posting_list,
           const PropertyStore& store,
           const QueryOptions& options = {})
    -> std::expected<QueryResult, core::error>;

} // namespace homeindex::search
