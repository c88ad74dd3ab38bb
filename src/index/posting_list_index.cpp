#include "homeindex/index/posting_list_index.hpp"
#include "homeindex/core/platform_utils.hpp"
#include "index_detail.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace homeindex::index {

class PostingListIndex::Impl {
public:
    explicit Impl(const IndexConfig& config) : config_(config) {}

    void build(const PropertyStore& store) {
        const auto start = std::chrono::steady_clock::now();
        num_properties_ = store.size();

        for (const auto& p : store) {
            for (auto a : all_attributes) {
                attrs_[attribute_index(a)].lists[attribute_key(p, a, config_)].push_back(p.id);
            }
        }
        cols_.build(store);

        for (auto a : all_attributes) {
            auto& ai = attrs_[attribute_index(a)];
            ai.sorted_keys.reserve(ai.lists.size());
            for (auto& [key, list] : ai.lists) {
                finalize(list);
                ai.sorted_keys.push_back(key);
                stats_.total_postings += list.size();
            }
            std::sort(ai.sorted_keys.begin(), ai.sorted_keys.end());
            stats_.posting_keys += ai.sorted_keys.size();
        }

        stats_.num_properties = num_properties_;
        if (auto k = keys(Attribute::bedrooms); !k.empty()) {
            stats_.max_bedrooms = static_cast<std::int32_t>(k.back());
        }
        if (auto k = keys(Attribute::bathrooms); !k.empty()) {
            stats_.max_bathrooms = static_cast<double>(k.back()) / 2.0;
        }
        stats_.build_time = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);

        if (core::debug_enabled()) {
            std::cerr << "[HOMEINDEX][build] posting-list index n=" << num_properties_
                      << " keys=" << stats_.posting_keys
                      << " postings=" << stats_.total_postings
                      << " merge=" << to_string(config_.merge)
                      << " in " << std::chrono::duration<double, std::milli>(stats_.build_time).count()
                      << " ms" << std::endl;
        }
    }

    auto evaluate(std::span<const KeyRange> ranges) const -> Evaluation {
        Evaluation ev;
        if (ranges.empty()) {
            ev.ids = detail::all_ids(num_properties_);
            return ev;
        }

        // Existence pass over every predicate first; no list is merged unless
        // every predicate has at least one posting.
        std::vector<KeyLookup> found;
        found.reserve(ranges.size());
        for (const auto& kr : ranges) {
            auto hit = locate(kr, ev.trace);
            if (!hit) {
                ev.trace.short_circuited = true;
                return ev;
            }
            found.push_back(*hit);
        }

        // Merged range lists are owned here; reserve so views stay valid.
        std::vector<PostingList> merged;
        merged.reserve(ranges.size());
        std::vector<PostingView> views;
        views.reserve(ranges.size());
        for (std::size_t i = 0; i < found.size(); ++i) {
            if (!found[i].direct.empty()) {
                views.push_back(found[i].direct);
                continue;
            }
            merged.push_back(union_of(ranges[i].attribute, found[i].keys, ev.trace));
            views.push_back(merged.back());
        }

        ev.ids = intersect_many(std::move(views), &ev.trace.intersect_steps);
        detail::apply_refinements(ev.ids, ranges, cols_, ev.trace);
        return ev;
    }

    auto postings(Attribute a, AttributeKey key) const noexcept -> PostingView {
        const auto& lists = attrs_[attribute_index(a)].lists;
        auto it = lists.find(key);
        if (it == lists.end()) return {};
        return it->second;
    }

    auto keys(Attribute a) const noexcept -> std::span<const AttributeKey> {
        return attrs_[attribute_index(a)].sorted_keys;
    }

    auto config() const noexcept -> const IndexConfig& { return config_; }
    auto size() const noexcept -> std::size_t { return num_properties_; }
    auto stats() const noexcept -> IndexStats { return stats_; }

private:
    struct AttributeIndex {
        std::unordered_map<AttributeKey, PostingList> lists;
        std::vector<AttributeKey> sorted_keys;
    };

    IndexConfig config_;
    std::array<AttributeIndex, attribute_count> attrs_{};
    detail::ExactColumns cols_;
    std::size_t num_properties_{0};
    IndexStats stats_{};

    static void finalize(PostingList& list) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
        list.shrink_to_fit();
    }

    // Where one predicate's ids live: a single stored list, or keys still to merge.
    struct KeyLookup {
        PostingView direct;
        std::span<const AttributeKey> keys;
    };

    // nullopt when the predicate matches nothing.
    auto locate(const KeyRange& kr, EvalTrace& trace) const -> std::optional<KeyLookup> {
        if (kr.empty()) return std::nullopt;

        if (kr.single_key()) {
            ++trace.keys_looked_up;
            auto list = postings(kr.attribute, kr.first);
            if (list.empty()) return std::nullopt;
            return KeyLookup{list, {}};
        }

        const auto in_range = detail::keys_in(keys(kr.attribute), kr);
        trace.keys_looked_up += in_range.size();
        if (in_range.empty()) return std::nullopt;
        if (in_range.size() == 1) return KeyLookup{postings(kr.attribute, in_range.front()), {}};
        return KeyLookup{{}, in_range};
    }

    auto union_of(Attribute a, std::span<const AttributeKey> in_range, EvalTrace& trace) const
        -> PostingList {
        std::vector<PostingView> parts;
        parts.reserve(in_range.size());
        for (AttributeKey key : in_range) parts.push_back(postings(a, key));
        return config_.merge == merge_strategy::heap
                   ? merge_union_heap(parts, &trace.union_steps)
                   : merge_union_pairwise(parts, &trace.union_steps);
    }
};

PostingListIndex::PostingListIndex() : impl_(std::make_unique<Impl>(IndexConfig{})) {}
PostingListIndex::~PostingListIndex() = default;
PostingListIndex::PostingListIndex(PostingListIndex&&) noexcept = default;
PostingListIndex& PostingListIndex::operator=(PostingListIndex&&) noexcept = default;

auto PostingListIndex::build(const PropertyStore& store, const IndexConfig& config)
    -> std::expected<PostingListIndex, core::error> {
    if (auto ok = config.validate(); !ok) return std::unexpected(ok.error());
    PostingListIndex out;
    out.impl_ = std::make_unique<Impl>(config);
    out.impl_->build(store);
    return out;
}

auto PostingListIndex::evaluate(std::span<const KeyRange> ranges) const -> Evaluation {
    return impl_->evaluate(ranges);
}
auto PostingListIndex::postings(Attribute attribute, AttributeKey key) const noexcept -> PostingView {
    return impl_->postings(attribute, key);
}
auto PostingListIndex::keys(Attribute attribute) const noexcept -> std::span<const AttributeKey> {
    return impl_->keys(attribute);
}
auto PostingListIndex::config() const noexcept -> const IndexConfig& { return impl_->config(); }
auto PostingListIndex::size() const noexcept -> std::size_t { return impl_->size(); }
auto PostingListIndex::stats() const noexcept -> IndexStats { return impl_->stats(); }

} // namespace homeindex::index
