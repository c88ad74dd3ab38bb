#pragma once

// Helpers shared by HashSetIndex and PostingListIndex. Private to the library.

#include <algorithm>
#include <numeric>
#include <span>
#include <vector>

#include "homeindex/attribute.hpp"
#include "homeindex/index/evaluation.hpp"
#include "homeindex/property.hpp"

namespace homeindex::index::detail {

// Exact values behind bucketed attributes, indexed by property id.
struct ExactColumns {
    std::vector<std::int64_t> price;
    std::vector<std::int64_t> year_built;

    void build(const PropertyStore& store) {
        price.reserve(store.size());
        year_built.reserve(store.size());
        for (const auto& p : store) {
            price.push_back(bucketed_value(p, Attribute::price));
            year_built.push_back(bucketed_value(p, Attribute::year_built));
        }
    }

    auto value(Attribute a, PropertyId id) const noexcept -> std::int64_t {
        return a == Attribute::price ? price[id] : year_built[id];
    }
};

// Keys of a sorted key list falling inside kr.
inline auto keys_in(std::span<const AttributeKey> sorted, const KeyRange& kr) noexcept
    -> std::span<const AttributeKey> {
    auto lo = std::lower_bound(sorted.begin(), sorted.end(), kr.first);
    auto hi = std::upper_bound(lo, sorted.end(), kr.last);
    return sorted.subspan(static_cast<std::size_t>(lo - sorted.begin()),
                          static_cast<std::size_t>(hi - lo));
}

// Drop ids whose exact value falls outside a refinement bound; order preserved.
inline void apply_refinements(std::vector<PropertyId>& ids, std::span<const KeyRange> ranges,
                              const ExactColumns& cols, EvalTrace& trace) {
    for (const auto& kr : ranges) {
        if (!kr.refine || ids.empty()) continue;
        const auto lo = kr.refine->min_value;
        const auto hi = kr.refine->max_value;
        trace.refined += ids.size();
        std::erase_if(ids, [&](PropertyId id) {
            const auto v = cols.value(kr.attribute, id);
            return v < lo || v > hi;
        });
    }
}

inline auto all_ids(std::size_t n) -> std::vector<PropertyId> {
    std::vector<PropertyId> ids(n);
    std::iota(ids.begin(), ids.end(), PropertyId{0});
    return ids;
}

} // namespace homeindex::index::detail
