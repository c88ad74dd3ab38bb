#include <catch2/catch_all.hpp>

#include "homeindex/index_set.hpp"
#include "homeindex/index/posting_ops.hpp"
#include "homeindex/search/query_planner.hpp"
#include "dataset_generator.hpp"

#include <algorithm>
#include <random>

using namespace homeindex;

// Both index paths and a linear scan agree on random valid filters.
TEST_CASE("index paths agree with a full scan", "[property]") {
    const auto seed = GENERATE(1u, 17u, 4242u);
    const auto merge = GENERATE(merge_strategy::pairwise, merge_strategy::heap);

    test::DatasetParams params;
    params.count = 2500;
    params.seed = seed;
    const auto records = test::generate_properties(params);

    IndexConfig cfg;
    cfg.merge = merge;
    cfg.price_bucket_width = seed == 17u ? 25'000 : 50'000;
    auto set = build_indexes(records, cfg);
    REQUIRE(set.has_value());
    search::QueryPlanner planner(*set);

    std::mt19937 rng(seed * 31u + 7u);
    for (int q = 0; q < 300; ++q) {
        const auto f = test::random_filter(rng, params);
        auto r = planner.query(f);
        REQUIRE(r.has_value());
        REQUIRE(index::is_strictly_ascending(r->ids));
        REQUIRE(r->ids == test::scan_matches(records, f));
        REQUIRE(r->properties.size() == r->ids.size());
    }
    REQUIRE(planner.get_stats().mismatches == 0);
}

// Adding a predicate never grows the result.
TEST_CASE("conjunction is monotone", "[property]") {
    test::DatasetParams params;
    params.count = 1200;
    auto set = build_indexes(test::generate_properties(params));
    REQUIRE(set.has_value());
    search::QueryPlanner planner(*set);

    std::mt19937 rng(99);
    for (int q = 0; q < 200; ++q) {
        auto f = test::random_filter(rng, params);
        auto base = planner.query(f);
        REQUIRE(base.has_value());

        auto extra = test::random_filter(rng, params);
        for (auto& p : extra.predicates) f.predicates.push_back(p);
        auto narrowed = planner.query(f);
        REQUIRE(narrowed.has_value());
        REQUIRE(narrowed->ids.size() <= base->ids.size());
        REQUIRE(std::includes(base->ids.begin(), base->ids.end(),
                              narrowed->ids.begin(), narrowed->ids.end()));
    }
}
