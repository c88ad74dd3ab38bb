#pragma once

/**
 * \file index_set.hpp
 * \brief The immutable store + index pair built once at startup.
 *
 * Ownership & lifetime: an IndexSet owns the property store and both indexes.
 * It is move-only and never mutated after build_indexes() returns, so it can be
 * shared by reference with any number of concurrent QueryPlanner callers.
 */

#include <expected>
#include <vector>

#include "homeindex/config.hpp"
#include "homeindex/error.hpp"
#include "homeindex/index/hash_set_index.hpp"
#include "homeindex/index/posting_list_index.hpp"
#include "homeindex/property.hpp"

namespace homeindex {

class IndexSet;

/** \brief Number the records and build both indexes over them.
 *
 * \param properties Cleaned dataset; ids are reassigned to insertion order
 * \param config Bucket widths and merge strategy
 * \return Immutable index set, or invalid_argument / config_invalid
 *
 * An empty dataset is not an error: a warning is logged and every query
 * against the result returns no ids.
 */
auto build_indexes(std::vector<Property> properties, const IndexConfig& config = {})
    -> std::expected<IndexSet, core::error>;

class IndexSet {
public:
    IndexSet(IndexSet&&) noexcept = default;
    IndexSet& operator=(IndexSet&&) noexcept = default;
    IndexSet(const IndexSet&) = delete;
    IndexSet& operator=(const IndexSet&) = delete;

    auto store() const noexcept -> const PropertyStore& { return store_; }
    auto hash_set() const noexcept -> const index::HashSetIndex& { return hash_set_; }
    auto posting_list() const noexcept -> const index::PostingListIndex& { return posting_list_; }
    auto config() const noexcept -> const IndexConfig& { return config_; }

private:
    friend auto build_indexes(std::vector<Property> properties, const IndexConfig& config)
        -> std::expected<IndexSet, core::error>;

    IndexSet(PropertyStore store, index::HashSetIndex hs, index::PostingListIndex pl,
             const IndexConfig& config)
        : store_(std::move(store)), hash_set_(std::move(hs)),
          posting_list_(std::move(pl)), config_(config) {}

    PropertyStore store_;
    index::HashSetIndex hash_set_;
    index::PostingListIndex posting_list_;
    IndexConfig config_;
};

} // namespace homeindex
