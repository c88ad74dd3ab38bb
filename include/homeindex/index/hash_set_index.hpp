#pragma once

/** \file hash_set_index.hpp
 *  \brief Inverted index: attribute -> key -> unordered set of property ids.
 *
 * Storage is HashTable<AttributeKey, HashSet<PropertyId>> per attribute.
 * Query: union the buckets of each range, then intersect the per-predicate
 * sets smallest first by probing membership, then sort the survivors.
 *
 * Thread-safety: build() is single-threaded; evaluate() is const and safe for
 * concurrent calls.
 * Memory: O(P * A) ids plus hash table slack.
 */

#include <expected>
#include <memory>
#include <span>

#include "homeindex/attribute.hpp"
#include "homeindex/config.hpp"
#include "homeindex/container/hash_table.hpp"
#include "homeindex/error.hpp"
#include "homeindex/index/evaluation.hpp"
#include "homeindex/property.hpp"

namespace homeindex::index {

using IdSet = container::HashSet<PropertyId>;

class HashSetIndex {
public:
    /** \brief Empty index over zero properties with the default config. */
    HashSetIndex();
    ~HashSetIndex();
    /** \brief Moved-from indexes hold no state: only destruction and
     *  assignment of a new index are valid until then. */
    HashSetIndex(HashSetIndex&&) noexcept;
    HashSetIndex& operator=(HashSetIndex&&) noexcept;
    HashSetIndex(const HashSetIndex&) = delete;
    HashSetIndex& operator=(const HashSetIndex&) = delete;

    /** \brief Index every property under every attribute in one pass.
     *
     * \param store Records to index; ids must be 0..n-1
     * \param config Bucket widths (validated)
     * \return Built index or config_invalid
     *
     * Complexity: O(P * A) expected
     */
    static auto build(const PropertyStore& store, const IndexConfig& config)
        -> std::expected<HashSetIndex, core::error>;

    /** \brief Evaluate the conjunction of resolved predicates.
     *
     * \param ranges Output of resolve_filter() against the same config
     * \return Matching ids ascending plus work counters
     *
     * An empty span matches every property.
     */
    auto evaluate(std::span<const KeyRange> ranges) const -> Evaluation;

    /** \brief Set stored under (attribute, key), nullptr when absent. */
    auto find(Attribute attribute, AttributeKey key) const noexcept -> const IdSet*;

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
