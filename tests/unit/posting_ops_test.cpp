/** \file posting_ops_test.cpp
 *  \brief Union and intersection over sorted posting lists.
 */

#include <catch2/catch_test_macros.hpp>

#include "homeindex/index/posting_ops.hpp"

#include <algorithm>
#include <iterator>
#include <random>
#include <set>
#include <vector>

using namespace homeindex;
using namespace homeindex::index;

namespace {

auto random_list(std::mt19937& rng, std::size_t max_len, PropertyId universe) -> PostingList {
    std::uniform_int_distribution<std::size_t> len(0, max_len);
    std::uniform_int_distribution<PropertyId> id(0, universe);
    std::set<PropertyId> s;
    const auto n = len(rng);
    for (std::size_t i = 0; i < n; ++i) s.insert(id(rng));
    return PostingList(s.begin(), s.end());
}

auto views_of(const std::vector<PostingList>& lists) -> std::vector<PostingView> {
    return std::vector<PostingView>(lists.begin(), lists.end());
}

} // namespace

TEST_CASE("two-way union and intersection", "[posting_ops]") {
    const PostingList a{1, 3, 5, 7};
    const PostingList b{2, 3, 6, 7, 9};

    REQUIRE(merge_union_two(a, b) == PostingList{1, 2, 3, 5, 6, 7, 9});
    REQUIRE(intersect_two(a, b) == PostingList{3, 7});

    SECTION("empty operands") {
        REQUIRE(merge_union_two(a, PostingList{}) == a);
        REQUIRE(intersect_two(PostingList{}, b).empty());
    }
    SECTION("intersection stops once one side is exhausted") {
        const PostingList tiny{0};
        const PostingList big{5, 6, 7, 8, 9, 10, 11, 12};
        std::size_t steps = 0;
        REQUIRE(intersect_two(tiny, big, &steps).empty());
        REQUIRE(steps == 1);
    }
}

TEST_CASE("pairwise and heap unions agree", "[posting_ops][merge]") {
    std::mt19937 rng(99);
    for (int trial = 0; trial < 200; ++trial) {
        std::uniform_int_distribution<int> k(0, 12);
        std::vector<PostingList> lists(static_cast<std::size_t>(k(rng)));
        for (auto& l : lists) l = random_list(rng, 40, 500);
        const auto views = views_of(lists);

        const auto pairwise = merge_union_pairwise(views);
        const auto heap = merge_union_heap(views);
        REQUIRE(pairwise == heap);
        REQUIRE(is_strictly_ascending(pairwise));

        std::set<PropertyId> model;
        for (const auto& l : lists) model.insert(l.begin(), l.end());
        REQUIRE(pairwise == PostingList(model.begin(), model.end()));
    }
}

TEST_CASE("intersect_many matches set intersection", "[posting_ops][intersect]") {
    std::mt19937 rng(7);
    for (int trial = 0; trial < 200; ++trial) {
        std::uniform_int_distribution<int> k(1, 5);
        std::vector<PostingList> lists(static_cast<std::size_t>(k(rng)));
        for (auto& l : lists) l = random_list(rng, 120, 150);

        PostingList model = lists.front();
        for (std::size_t i = 1; i < lists.size(); ++i) {
            PostingList next;
            std::set_intersection(model.begin(), model.end(), lists[i].begin(), lists[i].end(),
                                  std::back_inserter(next));
            model = std::move(next);
        }
        const auto got = intersect_many(views_of(lists));
        REQUIRE(got == model);
        REQUIRE(is_strictly_ascending(got));
    }
}

TEST_CASE("intersect_many shortcuts on an empty list", "[posting_ops][intersect]") {
    const PostingList a{1, 2, 3, 4, 5, 6};
    const PostingList b{2, 4, 6};
    const PostingList none{};
    std::size_t steps = 0;
    REQUIRE(intersect_many({a, none, b}, &steps).empty());
    REQUIRE(steps == 0);
    REQUIRE(intersect_many({}).empty());
}

TEST_CASE("strict ascent check", "[posting_ops]") {
    REQUIRE(is_strictly_ascending(PostingList{}));
    REQUIRE(is_strictly_ascending(PostingList{4}));
    REQUIRE(is_strictly_ascending(PostingList{1, 2, 9}));
    REQUIRE_FALSE(is_strictly_ascending(PostingList{1, 1, 2}));
    REQUIRE_FALSE(is_strictly_ascending(PostingList{3, 2}));
}

TEST_CASE("pairwise union rescans each id once per tree level", "[posting_ops][merge]") {
    // 16 disjoint lists of 100 ids: a left fold would take about 13500 steps.
    std::vector<PostingList> lists(16);
    for (PropertyId i = 0; i < 1600; ++i) lists[i % 16].push_back(i);
    const auto views = views_of(lists);

    std::size_t pairwise_steps = 0;
    std::size_t heap_steps = 0;
    const auto pairwise = merge_union_pairwise(views, &pairwise_steps);
    const auto heap = merge_union_heap(views, &heap_steps);
    REQUIRE(pairwise == heap);
    REQUIRE(pairwise.size() == 1600);
    REQUIRE(heap_steps == 1600);
    REQUIRE(pairwise_steps <= 1600 * 4);

    SECTION("odd list counts carry the leftover list up a level") {
        std::vector<PostingList> odd{{1, 4}, {2, 5}, {3, 6}};
        std::size_t steps = 0;
        REQUIRE(merge_union_pairwise(views_of(odd), &steps) == PostingList{1, 2, 3, 4, 5, 6});
        REQUIRE(steps <= 6 * 2);
    }
}
