#pragma once

/** \file posting_ops.hpp
 *  \brief Linear-time algorithms over sorted, duplicate-free posting lists.
 *
 * Every input must be strictly ascending; every output is strictly ascending.
 * The step counter, when given, accumulates the number of elementary steps
 * (pointer advances or heap pops) so callers can report work done.
 */

#include <cstddef>
#include <span>
#include <vector>

#include "homeindex/property.hpp"

namespace homeindex::index {

using PostingList = std::vector<PropertyId>;
using PostingView = std::span<const PropertyId>;

/** \brief a ∪ b by synchronized advance. */
auto merge_union_two(PostingView a, PostingView b, std::size_t* steps = nullptr) -> PostingList;

/** \brief Union of all lists by merge_union_two over a balanced tree of
 *  neighbouring pairs: O(N log k) for k lists holding N ids. */
auto merge_union_pairwise(std::span<const PostingView> lists, std::size_t* steps = nullptr)
    -> PostingList;

/** \brief Union of all lists with one k-way merge over a min-heap of list heads. */
auto merge_union_heap(std::span<const PostingView> lists, std::size_t* steps = nullptr)
    -> PostingList;

/** \brief a ∩ b: advance the side holding the smaller id, emit on equality,
 *  stop as soon as either side is exhausted. */
auto intersect_two(PostingView a, PostingView b, std::size_t* steps = nullptr) -> PostingList;

/** \brief Intersection of all lists, shortest first; stops early on an empty
 *  intermediate result. No lists yields an empty result. */
auto intersect_many(std::vector<PostingView> lists, std::size_t* steps = nullptr) -> PostingList;

/** \brief True when v is strictly ascending (hence duplicate-free). */
auto is_strictly_ascending(PostingView v) noexcept -> bool;

} // namespace homeindex::index
