/** \file attribute_resolve_test.cpp
 *  \brief Key projection and filter resolution into key intervals.
 */

#include <catch2/catch_test_macros.hpp>

#include "homeindex/attribute.hpp"

#include <limits>
#include <string>

using namespace homeindex;

namespace {

auto resolve_one(const predicate& p, const IndexConfig& cfg = {}) -> KeyRange {
    query_filter f;
    f.predicates.push_back(p);
    auto r = resolve_filter(f, cfg);
    REQUIRE(r.has_value());
    REQUIRE(r->size() == 1);
    return r->front();
}

auto resolve_error(const predicate& p) -> core::error_code {
    query_filter f;
    f.predicates.push_back(p);
    auto r = resolve_filter(f, IndexConfig{});
    REQUIRE_FALSE(r.has_value());
    return r.error().code;
}

} // namespace

TEST_CASE("attribute names round-trip", "[attribute]") {
    for (auto a : all_attributes) {
        auto back = attribute_from_name(attribute_name(a));
        REQUIRE(back.has_value());
        REQUIRE(*back == a);
    }
    REQUIRE_FALSE(attribute_from_name("pool").has_value());
    REQUIRE_FALSE(attribute_from_name("").has_value());
}

TEST_CASE("attribute keys follow the projection rules", "[attribute]") {
    Property p;
    p.bedrooms = 3;
    p.bathrooms = 2.5;
    p.price = 275'000;
    p.year_built = 1987;
    p.has_garage = true;

    IndexConfig cfg;
    REQUIRE(attribute_key(p, Attribute::bedrooms, cfg) == 3);
    REQUIRE(attribute_key(p, Attribute::bathrooms, cfg) == 5);
    REQUIRE(attribute_key(p, Attribute::price, cfg) == 5);
    REQUIRE(attribute_key(p, Attribute::year_built, cfg) == 198);
    REQUIRE(attribute_key(p, Attribute::has_garage, cfg) == 1);
    REQUIRE(attribute_key(p, Attribute::has_attic, cfg) == 0);

    cfg.price_bucket_width = 100'000;
    cfg.year_bucket_width = 1;
    REQUIRE(attribute_key(p, Attribute::price, cfg) == 2);
    REQUIRE(attribute_key(p, Attribute::year_built, cfg) == 1987);
}

TEST_CASE("exact terms resolve to a single key", "[attribute][resolve]") {
    SECTION("discrete") {
        auto kr = resolve_one(term{"bedrooms", std::int64_t{3}});
        REQUIRE(kr.attribute == Attribute::bedrooms);
        REQUIRE(kr.first == 3);
        REQUIRE(kr.last == 3);
        REQUIRE_FALSE(kr.refine.has_value());
    }
    SECTION("whole double on a discrete attribute") {
        auto kr = resolve_one(term{"bedrooms", 3.0});
        REQUIRE(kr.first == 3);
        REQUIRE(kr.last == 3);
    }
    SECTION("fractional value on a discrete attribute cannot match") {
        auto kr = resolve_one(term{"bedrooms", 2.5});
        REQUIRE(kr.empty());
    }
    SECTION("half-step") {
        auto kr = resolve_one(term{"bathrooms", 1.5});
        REQUIRE(kr.first == 3);
        REQUIRE(kr.last == 3);
    }
    SECTION("bathrooms off the half-step grid cannot match") {
        auto kr = resolve_one(term{"bathrooms", 1.25});
        REQUIRE(kr.empty());
    }
    SECTION("flag") {
        auto kr = resolve_one(term{"has_basement", false});
        REQUIRE(kr.attribute == Attribute::has_basement);
        REQUIRE(kr.first == 0);
        REQUIRE(kr.last == 0);
    }
    SECTION("exact price refines inside its bucket") {
        auto kr = resolve_one(term{"price", std::int64_t{275'000}});
        REQUIRE(kr.first == 5);
        REQUIRE(kr.last == 5);
        REQUIRE(kr.refine.has_value());
        REQUIRE(kr.refine->min_value == 275'000);
        REQUIRE(kr.refine->max_value == 275'000);
    }
}

TEST_CASE("ranges resolve to inclusive key intervals", "[attribute][resolve]") {
    SECTION("discrete bounds are inclusive") {
        auto kr = resolve_one(range{"bedrooms", std::int64_t{2}, std::int64_t{4}});
        REQUIRE(kr.first == 2);
        REQUIRE(kr.last == 4);
    }
    SECTION("fractional bounds tighten inward") {
        auto kr = resolve_one(range{"bedrooms", 1.2, 3.9});
        REQUIRE(kr.first == 2);
        REQUIRE(kr.last == 3);
    }
    SECTION("half-step bounds") {
        auto kr = resolve_one(range{"bathrooms", 1.0, 2.5});
        REQUIRE(kr.first == 2);
        REQUIRE(kr.last == 5);
    }
    SECTION("bucket-aligned price range needs no refinement") {
        auto kr = resolve_one(range{"price", std::int64_t{200'000}, std::int64_t{299'999}});
        REQUIRE(kr.first == 4);
        REQUIRE(kr.last == 5);
        REQUIRE_FALSE(kr.refine.has_value());
    }
    SECTION("price range cutting through buckets carries exact bounds") {
        auto kr = resolve_one(range{"price", std::int64_t{200'000}, std::int64_t{300'000}});
        REQUIRE(kr.first == 4);
        REQUIRE(kr.last == 6);
        REQUIRE(kr.refine.has_value());
        REQUIRE(kr.refine->min_value == 200'000);
        REQUIRE(kr.refine->max_value == 300'000);
    }
    SECTION("year range with configured width") {
        IndexConfig cfg;
        cfg.year_bucket_width = 5;
        auto kr = resolve_one(range{"year_built", std::int64_t{1990}, std::int64_t{1999}}, cfg);
        REQUIRE(kr.first == 398);
        REQUIRE(kr.last == 399);
        REQUIRE_FALSE(kr.refine.has_value());
    }
    SECTION("negative lower price bound clips at zero") {
        auto kr = resolve_one(range{"price", std::int64_t{-10}, std::int64_t{49'999}});
        REQUIRE(kr.first == 0);
        REQUIRE(kr.last == 0);
        REQUIRE_FALSE(kr.refine.has_value());
    }
    SECTION("open-ended upper bound saturates") {
        auto kr = resolve_one(range{"price", std::int64_t{1'000'000},
                                    std::numeric_limits<std::int64_t>::max()});
        REQUIRE(kr.first == 20);
        REQUIRE(kr.last > kr.first);
    }
    SECTION("range between two half steps is empty") {
        auto kr = resolve_one(range{"bathrooms", 1.6, 1.9});
        REQUIRE(kr.empty());
    }
}

TEST_CASE("invalid predicates are rejected", "[attribute][resolve][errors]") {
    REQUIRE(resolve_error(term{"pool", true}) == core::error_code::unknown_attribute);
    REQUIRE(resolve_error(range{"sqft", std::int64_t{1}, std::int64_t{2}})
            == core::error_code::unknown_attribute);
    REQUIRE(resolve_error(range{"bedrooms", std::int64_t{4}, std::int64_t{2}})
            == core::error_code::invalid_range);
    REQUIRE(resolve_error(range{"price", 300'000.5, 300'000.0})
            == core::error_code::invalid_range);
    REQUIRE(resolve_error(range{"bedrooms", std::string("two"), std::int64_t{3}})
            == core::error_code::invalid_range);
    REQUIRE(resolve_error(range{"bedrooms", std::numeric_limits<double>::quiet_NaN(), 3.0})
            == core::error_code::invalid_range);
    REQUIRE(resolve_error(range{"has_garage", std::int64_t{0}, std::int64_t{1}})
            == core::error_code::invalid_range);
    REQUIRE(resolve_error(term{"bedrooms", std::string("3")}) == core::error_code::invalid_argument);
    REQUIRE(resolve_error(term{"has_attic", std::int64_t{1}}) == core::error_code::invalid_argument);
}

TEST_CASE("required flags resolve after predicates", "[attribute][resolve]") {
    query_filter f;
    f.predicates.push_back(term{"bedrooms", std::int64_t{3}});
    f.required_flags = {"has_garage", "has_attic"};
    auto r = resolve_filter(f, IndexConfig{});
    REQUIRE(r.has_value());
    REQUIRE(r->size() == 3);
    REQUIRE((*r)[1].attribute == Attribute::has_garage);
    REQUIRE((*r)[1].first == 1);
    REQUIRE((*r)[2].attribute == Attribute::has_attic);

    SECTION("a non-flag name in the flag list is unknown") {
        f.required_flags.push_back("bedrooms");
        auto bad = resolve_filter(f, IndexConfig{});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == core::error_code::unknown_attribute);
    }
}

TEST_CASE("empty filter resolves to nothing", "[attribute][resolve]") {
    auto r = resolve_filter(query_filter{}, IndexConfig{});
    REQUIRE(r.has_value());
    REQUIRE(r->empty());
}
