#include "homeindex/index/hash_set_index.hpp"
#include "homeindex/core/platform_utils.hpp"
#include "index_detail.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <optional>
#include <span>
#include <vector>

namespace homeindex::index {

class HashSetIndex::Impl {
public:
    explicit Impl(const IndexConfig& config) : config_(config) {}

    void build(const PropertyStore& store) {
        const auto start = std::chrono::steady_clock::now();
        num_properties_ = store.size();

        for (const auto& p : store) {
            for (auto a : all_attributes) {
                attrs_[attribute_index(a)].by_key
                    .get_or_insert(attribute_key(p, a, config_))
                    .insert(p.id);
            }
        }
        cols_.build(store);

        for (auto a : all_attributes) {
            auto& ai = attrs_[attribute_index(a)];
            ai.sorted_keys.reserve(ai.by_key.size());
            for (const auto& [key, ids] : ai.by_key) {
                ai.sorted_keys.push_back(key);
                stats_.total_postings += ids.size();
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
            std::cerr << "[HOMEINDEX][build] hash-set index n=" << num_properties_
                      << " keys=" << stats_.posting_keys
                      << " postings=" << stats_.total_postings
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

        // Existence pass over every predicate before any union is built, so a
        // missing key anywhere in the filter costs lookups only.
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

        // Unions are owned here; reserve so pointers into it stay valid.
        std::vector<IdSet> unions;
        unions.reserve(ranges.size());
        std::vector<const IdSet*> sets;
        sets.reserve(ranges.size());
        for (std::size_t i = 0; i < found.size(); ++i) {
            sets.push_back(found[i].direct ? found[i].direct
                                            : &union_of(ranges[i].attribute, found[i].keys,
                                                        unions, ev.trace));
        }

        // Smallest set drives; the others are checked in ascending size order.
        std::sort(sets.begin(), sets.end(),
                  [](const IdSet* x, const IdSet* y) { return x->size() < y->size(); });

        const IdSet& driver = *sets.front();
        ev.ids.reserve(driver.size());
        for (PropertyId id : driver) {
            bool keep = true;
            for (std::size_t k = 1; k < sets.size(); ++k) {
                ++ev.trace.intersect_steps;
                if (!sets[k]->contains(id)) {
                    keep = false;
                    break;
                }
            }
            if (keep) ev.ids.push_back(id);
        }

        detail::apply_refinements(ev.ids, ranges, cols_, ev.trace);
        std::sort(ev.ids.begin(), ev.ids.end());
        return ev;
    }

    auto find(Attribute a, AttributeKey key) const noexcept -> const IdSet* {
        return attrs_[attribute_index(a)].by_key.get(key);
    }

    auto keys(Attribute a) const noexcept -> std::span<const AttributeKey> {
        return attrs_[attribute_index(a)].sorted_keys;
    }

    auto config() const noexcept -> const IndexConfig& { return config_; }
    auto size() const noexcept -> std::size_t { return num_properties_; }
    auto stats() const noexcept -> IndexStats { return stats_; }

private:
    struct AttributeIndex {
        container::HashTable<AttributeKey, IdSet> by_key;
        std::vector<AttributeKey> sorted_keys;
    };

    IndexConfig config_;
    std::array<AttributeIndex, attribute_count> attrs_{};
    detail::ExactColumns cols_;
    std::size_t num_properties_{0};
    IndexStats stats_{};

    // Where one predicate's ids live: a single stored set, or keys still to union.
    struct KeyLookup {
        const IdSet* direct{nullptr};
        std::span<const AttributeKey> keys;
    };

    // nullopt when the predicate matches nothing.
    auto locate(const KeyRange& kr, EvalTrace& trace) const -> std::optional<KeyLookup> {
        if (kr.empty()) return std::nullopt;
        const auto& ai = attrs_[attribute_index(kr.attribute)];

        if (kr.single_key()) {
            ++trace.keys_looked_up;
            const IdSet* s = ai.by_key.get(kr.first);
            if (!s || s->empty()) return std::nullopt;
            return KeyLookup{s, {}};
        }

        auto in_range = detail::keys_in(ai.sorted_keys, kr);
        trace.keys_looked_up += in_range.size();
        if (in_range.empty()) return std::nullopt;
        if (in_range.size() == 1) return KeyLookup{ai.by_key.get(in_range.front()), {}};
        return KeyLookup{nullptr, in_range};
    }

    auto union_of(Attribute a, std::span<const AttributeKey> keys, std::vector<IdSet>& unions,
                  EvalTrace& trace) const -> const IdSet& {
        const auto& ai = attrs_[attribute_index(a)];
        std::vector<const IdSet*> buckets;
        buckets.reserve(keys.size());
        std::size_t total = 0;
        for (AttributeKey key : keys) {
            if (const IdSet* s = ai.by_key.get(key)) {
                buckets.push_back(s);
                total += s->size();
            }
        }
        IdSet u;
        u.reserve(total);
        for (const IdSet* s : buckets) {
            for (PropertyId id : *s) {
                u.insert(id);
                ++trace.union_steps;
            }
        }
        unions.push_back(std::move(u));
        return unions.back();
    }
};

HashSetIndex::HashSetIndex() : impl_(std::make_unique<Impl>(IndexConfig{})) {}
HashSetIndex::~HashSetIndex() = default;
HashSetIndex::HashSetIndex(HashSetIndex&&) noexcept = default;
HashSetIndex& HashSetIndex::operator=(HashSetIndex&&) noexcept = default;

auto HashSetIndex::build(const PropertyStore& store, const IndexConfig& config)
    -> std::expected<HashSetIndex, core::error> {
    if (auto ok = config.validate(); !ok) return std::unexpected(ok.error());
    HashSetIndex out;
    out.impl_ = std::make_unique<Impl>(config);
    out.impl_->build(store);
    return out;
}

auto HashSetIndex::evaluate(std::span<const KeyRange> ranges) const -> Evaluation {
    return impl_->evaluate(ranges);
}
auto HashSetIndex::find(Attribute attribute, AttributeKey key) const noexcept -> const IdSet* {
    return impl_->find(attribute, key);
}
auto HashSetIndex::keys(Attribute attribute) const noexcept -> std::span<const AttributeKey> {
    return impl_->keys(attribute);
}
auto HashSetIndex::config() const noexcept -> const IndexConfig& { return impl_->config(); }
auto HashSetIndex::size() const noexcept -> std::size_t { return impl_->size(); }
auto HashSetIndex::stats() const noexcept -> IndexStats { return impl_->stats(); }

} // namespace homeindex::index
