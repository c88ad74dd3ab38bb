#include "homeindex/search/query_planner.hpp"
#include "homeindex/attribute.hpp"
#include "homeindex/core/platform_utils.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <string>

namespace homeindex::search {

namespace {

constexpr const char* component = "search.query_planner";

// Position of the first id present in one sequence but not the other.
auto first_difference(const std::vector<PropertyId>& a, const std::vector<PropertyId>& b)
    -> std::string {
    auto [ia, ib] = std::mismatch(a.begin(), a.end(), b.begin(), b.end());
    if (ia != a.end() && (ib == b.end() || *ia < *ib)) return "hash_set has " + std::to_string(*ia);
    if (ib != b.end()) return "posting_list has " + std::to_string(*ib);
    return "none";
}

} // namespace

class QueryPlanner::Impl {
public:
    Impl(const PropertyStore& store,
         const index::HashSetIndex& hash_set,
         const index::PostingListIndex& posting_list)
        : store_(store), hash_set_(hash_set), posting_list_(posting_list) {}

    auto query(const query_filter& filter, const QueryOptions& options) const
        -> std::expected<QueryResult, core::error> {
        if (!hash_set_.config().same_buckets(posting_list_.config())) {
            return std::unexpected(core::error{core::error_code::config_invalid,
                                               "indexes were built with different bucket widths",
                                               component});
        }
        if (hash_set_.size() != store_.size() || posting_list_.size() != store_.size()) {
            return std::unexpected(core::error{core::error_code::precondition_failed,
                                               "index size does not match property store",
                                               component});
        }

        auto ranges = resolve_filter(filter, hash_set_.config());
        if (!ranges) {
            queries_rejected_.fetch_add(1, std::memory_order_acq_rel);
            if (core::debug_enabled()) {
                std::cerr << "[HOMEINDEX][query] rejected: " << core::to_string(ranges.error().code)
                          << " " << ranges.error().message << std::endl;
            }
            return std::unexpected(ranges.error());
        }

        QueryResult out;
        index::Evaluation hs;
        index::Evaluation pl;
        const bool run_hs = options.mode != evaluation_mode::posting_list_only;
        const bool run_pl = options.mode != evaluation_mode::hash_set_only;

        if (run_hs) {
            const auto t0 = std::chrono::steady_clock::now();
            hs = hash_set_.evaluate(*ranges);
            out.hash_set_elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - t0);
        }
        if (run_pl) {
            const auto t0 = std::chrono::steady_clock::now();
            pl = posting_list_.evaluate(*ranges);
            out.posting_list_elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - t0);
        }

        if (run_hs && run_pl && hs.ids != pl.ids) {
            mismatches_.fetch_add(1, std::memory_order_acq_rel);
            const std::string detail = "hash_set=" + std::to_string(hs.ids.size()) +
                                       " posting_list=" + std::to_string(pl.ids.size()) +
                                       " first difference: " + first_difference(hs.ids, pl.ids);
            std::cerr << "[HOMEINDEX][query] result mismatch " << detail << std::endl;
            return std::unexpected(core::error{core::error_code::result_mismatch,
                                               "index paths disagree: " + detail, component});
        }

        out.hash_set_trace = hs.trace;
        out.posting_list_trace = pl.trace;
        out.ids = run_pl ? std::move(pl.ids) : std::move(hs.ids);

        const std::size_t n = options.hydrate_limit == 0
                                  ? out.ids.size()
                                  : std::min(options.hydrate_limit, out.ids.size());
        out.properties.reserve(n);
        for (std::size_t i = 0; i < n; ++i) out.properties.push_back(store_[out.ids[i]]);

        queries_executed_.fetch_add(1, std::memory_order_acq_rel);
        hash_set_ns_.fetch_add(out.hash_set_elapsed.count(), std::memory_order_acq_rel);
        posting_list_ns_.fetch_add(out.posting_list_elapsed.count(), std::memory_order_acq_rel);

        if (core::debug_enabled()) {
            std::cerr << "[HOMEINDEX][query] predicates=" << ranges->size()
                      << " matches=" << out.ids.size()
                      << " hash_set_ms=" << out.hash_set_ms()
                      << " posting_list_ms=" << out.posting_list_ms() << std::endl;
        }
        return out;
    }

    auto get_stats() const -> PlannerStats {
        PlannerStats s{};
        s.queries_executed = queries_executed_.load(std::memory_order_acquire);
        s.queries_rejected = queries_rejected_.load(std::memory_order_acquire);
        s.mismatches = mismatches_.load(std::memory_order_acquire);
        s.hash_set_time = std::chrono::nanoseconds(hash_set_ns_.load(std::memory_order_acquire));
        s.posting_list_time = std::chrono::nanoseconds(posting_list_ns_.load(std::memory_order_acquire));
        return s;
    }

private:
    const PropertyStore& store_;
    const index::HashSetIndex& hash_set_;
    const index::PostingListIndex& posting_list_;

    mutable std::atomic<std::uint64_t> queries_executed_{0};
    mutable std::atomic<std::uint64_t> queries_rejected_{0};
    mutable std::atomic<std::uint64_t> mismatches_{0};
    mutable std::atomic<std::int64_t> hash_set_ns_{0};
    mutable std::atomic<std::int64_t> posting_list_ns_{0};
};

QueryPlanner::QueryPlanner(const IndexSet& set)
    : impl_(std::make_unique<Impl>(set.store(), set.hash_set(), set.posting_list())) {}

QueryPlanner::QueryPlanner(const PropertyStore& store,
                           const index::HashSetIndex& hash_set,
                           const index::PostingListIndex& posting_list)
    : impl_(std::make_unique<Impl>(store, hash_set, posting_list)) {}

QueryPlanner::~QueryPlanner() = default;

auto QueryPlanner::query(const query_filter& filter, const QueryOptions& options) const
    -> std::expected<QueryResult, core::error> {
    return impl_->query(filter, options);
}

auto QueryPlanner::get_stats() const -> PlannerStats {
    return impl_->get_stats();
}

auto query(const query_filter& filter,
           const index::HashSetIndex& hash_set,
           const index::PostingListIndex& posting_list,
           const PropertyStore& store,
           const QueryOptions& options)
    -> std::expected<QueryResult, core::error> {
    QueryPlanner planner(store, hash_set, posting_list);
    return planner.query(filter, options);
}

} // namespace homeindex::search
