/** \file hash_set_index_test.cpp
 *  \brief Hash-set index build and conjunctive evaluation.
 */

#include <catch2/catch_test_macros.hpp>

#include "homeindex/attribute.hpp"
#include "homeindex/index/hash_set_index.hpp"

#include <vector>

using namespace homeindex;
using namespace homeindex::index;

namespace {

auto make_store(std::vector<Property> in) -> PropertyStore {
    auto store = PropertyStore::create(std::move(in));
    REQUIRE(store.has_value());
    return std::move(*store);
}

auto house(std::int32_t beds, std::int64_t price, bool garage = false) -> Property {
    Property p;
    p.bedrooms = beds;
    p.bathrooms = 2.0;
    p.price = price;
    p.year_built = 2001;
    p.has_garage = garage;
    return p;
}

auto run(const HashSetIndex& idx, const query_filter& f) -> Evaluation {
    auto ranges = resolve_filter(f, idx.config());
    REQUIRE(ranges.has_value());
    return idx.evaluate(*ranges);
}

} // namespace

TEST_CASE("hash-set index groups ids by attribute key", "[hash_set_index]") {
    auto store = make_store({house(2, 150'000), house(3, 250'000, true), house(3, 350'000),
                             house(4, 250'000), house(2, 99'000, true)});
    auto idx = HashSetIndex::build(store, IndexConfig{});
    REQUIRE(idx.has_value());
    REQUIRE(idx->size() == 5);

    const IdSet* three = idx->find(Attribute::bedrooms, 3);
    REQUIRE(three != nullptr);
    REQUIRE(three->size() == 2);
    REQUIRE(three->contains(1));
    REQUIRE(three->contains(2));
    REQUIRE(idx->find(Attribute::bedrooms, 7) == nullptr);

    const auto keys = idx->keys(Attribute::bedrooms);
    REQUIRE(std::vector<AttributeKey>(keys.begin(), keys.end()) == std::vector<AttributeKey>{2, 3, 4});

    const auto st = idx->stats();
    REQUIRE(st.num_properties == 5);
    REQUIRE(st.max_bedrooms == 4);
    REQUIRE(st.max_bathrooms == 2.0);
    // Every property lands once under each of the eight attributes.
    REQUIRE(st.total_postings == 5 * attribute_count);
}

TEST_CASE("hash-set evaluation", "[hash_set_index][evaluate]") {
    auto store = make_store({house(2, 150'000), house(3, 250'000, true), house(3, 350'000),
                             house(4, 250'000), house(2, 99'000, true)});
    auto idx = HashSetIndex::build(store, IndexConfig{});
    REQUIRE(idx.has_value());

    SECTION("empty filter matches every property") {
        auto ev = run(*idx, query_filter{});
        REQUIRE(ev.ids == std::vector<PropertyId>{0, 1, 2, 3, 4});
    }
    SECTION("exact match") {
        query_filter f;
        f.predicates.push_back(term{"bedrooms", std::int64_t{3}});
        REQUIRE(run(*idx, f).ids == std::vector<PropertyId>{1, 2});
    }
    SECTION("conjunction with a required flag") {
        query_filter f;
        f.predicates.push_back(term{"bedrooms", std::int64_t{2}});
        f.required_flags.push_back("has_garage");
        REQUIRE(run(*idx, f).ids == std::vector<PropertyId>{4});
    }
    SECTION("price range refines partial buckets") {
        query_filter f;
        f.predicates.push_back(range{"price", std::int64_t{200'000}, std::int64_t{300'000}});
        auto ev = run(*idx, f);
        REQUIRE(ev.ids == std::vector<PropertyId>{1, 3});
        REQUIRE(ev.trace.refined > 0);
    }
    SECTION("range over several keys unions them") {
        query_filter f;
        f.predicates.push_back(range{"bedrooms", std::int64_t{3}, std::int64_t{9}});
        auto ev = run(*idx, f);
        REQUIRE(ev.ids == std::vector<PropertyId>{1, 2, 3});
        REQUIRE(ev.trace.keys_looked_up == 2);
        REQUIRE(ev.trace.union_steps == 3);
    }
    SECTION("missing key short-circuits before any other work") {
        query_filter f;
        f.predicates.push_back(term{"bedrooms", std::int64_t{8}});
        f.predicates.push_back(range{"price", std::int64_t{0}, std::int64_t{1'000'000}});
        auto ev = run(*idx, f);
        REQUIRE(ev.ids.empty());
        REQUIRE(ev.trace.short_circuited);
        REQUIRE(ev.trace.keys_looked_up == 1);
        REQUIRE(ev.trace.union_steps == 0);
        REQUIRE(ev.trace.intersect_steps == 0);
    }
    SECTION("missing key listed after a multi-key range skips the union") {
        query_filter f;
        f.predicates.push_back(range{"bedrooms", std::int64_t{2}, std::int64_t{4}});
        f.predicates.push_back(term{"bedrooms", std::int64_t{8}});
        auto ev = run(*idx, f);
        REQUIRE(ev.ids.empty());
        REQUIRE(ev.trace.short_circuited);
        REQUIRE(ev.trace.keys_looked_up == 4);
        REQUIRE(ev.trace.union_steps == 0);
        REQUIRE(ev.trace.intersect_steps == 0);
    }
    SECTION("results are ascending even though sets are unordered") {
        query_filter f;
        f.predicates.push_back(range{"bathrooms", 1.0, 3.0});
        auto ev = run(*idx, f);
        REQUIRE(ev.ids == std::vector<PropertyId>{0, 1, 2, 3, 4});
    }
}

TEST_CASE("hash-set index over an empty store", "[hash_set_index][empty]") {
    auto store = make_store({});
    auto idx = HashSetIndex::build(store, IndexConfig{});
    REQUIRE(idx.has_value());
    REQUIRE(idx->size() == 0);
    REQUIRE(run(*idx, query_filter{}).ids.empty());

    query_filter f;
    f.required_flags.push_back("has_attic");
    auto ev = run(*idx, f);
    REQUIRE(ev.ids.empty());
    REQUIRE(ev.trace.short_circuited);
}

TEST_CASE("hash-set build rejects an invalid config", "[hash_set_index][errors]") {
    auto store = make_store({house(1, 100'000)});
    IndexConfig cfg;
    cfg.year_bucket_width = 0;
    auto idx = HashSetIndex::build(store, cfg);
    REQUIRE_FALSE(idx.has_value());
    REQUIRE(idx.error().code == core::error_code::config_invalid);
}
