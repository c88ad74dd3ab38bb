#pragma once

/** \file posting_list_index.hpp
 *  \brief Inverted index: attribute -> key -> sorted posting list.
 *
 * Build appends ids per key in a single scan, then sorts and dedups each
 * list once. Query selects lists directly for single keys, merges multi-key
 * ranges (pairwise or heap k-way, per IndexConfig::merge), and intersects
 * the per-predicate lists shortest first with a two-pointer merge.
 *
 * Invariant: every stored list is strictly ascending.
 * Thread-safety: build() is single-threaded; evaluate() is const and safe for
 * concurrent calls.
 */

#include <expected>
#include <memory>
#include <span>

#include "homeindex/attribute.hpp"
#include "homeindex/config.hpp"
#include "homeindex/error.hpp"
#include "homeindex/index/evaluation.hpp"
#include "homeindex/index/posting_ops.hpp"
#include "homeindex/property.hpp"

namespace homeindex::index {

class PostingListIndex {
public:
    /** \brief Empty index over zero properties with the default config. */
    PostingListIndex();
    ~PostingListIndex();
    /** \brief Moved-from indexes hold no state: only destruction and
     *  assignment of a new index are valid until then. */
    PostingListIndex(PostingListIndex&&) noexcept;
    PostingListIndex& operator=(PostingListIndex&&) noexcept;
    PostingListIndex(const PostingListIndex&) = delete;
    PostingListIndex& operator=(const PostingListIndex&) = delete;

    /** \brief Build sorted posting lists for every attribute.
     *
     * \param store Records to index; ids must be 0..n-1
     * \param config Bucket widths and merge strategy (validated)
     * \return Built index or config_invalid
     *
     * Complexity: O(P * A) appends plus one sort per distinct key
     */
    static auto build(const PropertyStore& store, const IndexConfig& config)
        -> std::expected<PostingListIndex, core::error>;

    /** \brief Evaluate the conjunction of resolved predicates.
     *
     * \param ranges Output of resolve_filter() against the same config
     * \return Matching ids ascending plus work counters
     */
    auto evaluate(std::span<const KeyRange> ranges) const -> Evaluation;

    /** \brief Posting list for (attribute, key); empty view when absent. */
    auto postings(Attribute attribute, AttributeKey key) const noexcept -> PostingView;

    /** \brief Distinct keys present for an attribute, ascending. */
    auto keys(Attribute attribute) const noexcept -> std::span<const AttributeKey>;

    auto config() const noexcept -> const IndexConfig&;
    auto size() const noexcept -> std::size_t;
    auto stats() const noexcept -> IndexStats;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace homeindex::index
