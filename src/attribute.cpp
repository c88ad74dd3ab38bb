#include "homeindex/attribute.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

namespace homeindex {

namespace {

constexpr std::int64_t i64_max = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t i64_min = std::numeric_limits<std::int64_t>::min();

constexpr std::array<std::string_view, attribute_count> names{
    "bedrooms", "bathrooms", "price", "year_built",
    "has_basement", "has_fireplace", "has_attic", "has_garage",
};

// Numeric operand keeping integers exact.
struct Number {
    bool integral{true};
    std::int64_t i{0};
    double d{0.0};

    auto as_double() const noexcept -> double { return integral ? static_cast<double>(i) : d; }
};

auto to_number(const predicate_value& v) -> std::optional<Number> {
    if (const auto* i = std::get_if<std::int64_t>(&v)) return Number{true, *i, 0.0};
    if (const auto* d = std::get_if<double>(&v)) {
        if (std::isnan(*d)) return std::nullopt;
        return Number{false, 0, *d};
    }
    return std::nullopt;
}

auto less(const Number& a, const Number& b) noexcept -> bool {
    if (a.integral && b.integral) return a.i < b.i;
    return static_cast<long double>(a.as_double()) < static_cast<long double>(b.as_double());
}

auto clamp_to_i64(double d) noexcept -> std::int64_t {
    if (d >= 9.2e18) return i64_max;
    if (d <= -9.2e18) return i64_min;
    return static_cast<std::int64_t>(d);
}

auto sat_mul2(std::int64_t v) noexcept -> std::int64_t {
    if (v > i64_max / 2) return i64_max;
    if (v < i64_min / 2) return i64_min;
    return v * 2;
}

// Smallest integer >= n, optionally after doubling (half-step attributes).
auto lower_int(const Number& n, bool halves) noexcept -> std::int64_t {
    if (n.integral) return halves ? sat_mul2(n.i) : n.i;
    return clamp_to_i64(std::ceil(halves ? n.d * 2.0 : n.d));
}

// Largest integer <= n, optionally after doubling.
auto upper_int(const Number& n, bool halves) noexcept -> std::int64_t {
    if (n.integral) return halves ? sat_mul2(n.i) : n.i;
    return clamp_to_i64(std::floor(halves ? n.d * 2.0 : n.d));
}

auto bucket_width(Attribute a, const IndexConfig& cfg) noexcept -> std::int64_t {
    return a == Attribute::price ? cfg.price_bucket_width : cfg.year_bucket_width;
}

auto make_error(core::error_code code, std::string msg) -> core::error {
    return core::error{code, std::move(msg), "attribute.resolve"};
}

auto empty_range(Attribute a) noexcept -> KeyRange {
    return KeyRange{a, 1, 0, std::nullopt};
}

// Interval of keys for numeric bounds [lo, hi] already checked lo <= hi.
auto numeric_range(Attribute a, const Number& lo, const Number& hi, const IndexConfig& cfg)
    -> KeyRange {
    const auto kind = attribute_kind(a);
    const bool halves = kind == AttributeKind::half_step;
    std::int64_t first = lower_int(lo, halves);
    std::int64_t last = upper_int(hi, halves);
    if (first > last) return empty_range(a);

    if (kind != AttributeKind::bucketed) return KeyRange{a, first, last, std::nullopt};

    // Bucketed values are positive, so negative lower bounds clip to zero.
    if (first < 0) first = 0;
    if (first > last) return empty_range(a);
    const std::int64_t w = bucket_width(a, cfg);
    KeyRange kr{a, first / w, last / w, std::nullopt};
    if (first % w != 0 || last % w != w - 1) {
        kr.refine = KeyRange::Refinement{first, last};
    }
    return kr;
}

auto resolve_term(Attribute a, const term& t, const IndexConfig& cfg)
    -> std::expected<KeyRange, core::error> {
    if (attribute_kind(a) == AttributeKind::flag) {
        const auto* b = std::get_if<bool>(&t.value);
        if (!b) {
            return std::unexpected(make_error(core::error_code::invalid_argument,
                                              "flag '" + t.field + "' requires a boolean value"));
        }
        const AttributeKey k = *b ? 1 : 0;
        return KeyRange{a, k, k, std::nullopt};
    }
    auto n = to_number(t.value);
    if (!n) {
        return std::unexpected(make_error(core::error_code::invalid_argument,
                                          "attribute '" + t.field + "' requires a numeric value"));
    }
    return numeric_range(a, *n, *n, cfg);
}

auto resolve_range(Attribute a, const range& r, const IndexConfig& cfg)
    -> std::expected<KeyRange, core::error> {
    if (attribute_kind(a) == AttributeKind::flag) {
        return std::unexpected(make_error(core::error_code::invalid_range,
                                          "range predicate on flag '" + r.field + "'"));
    }
    auto lo = to_number(r.min_value);
    auto hi = to_number(r.max_value);
    if (!lo || !hi) {
        return std::unexpected(make_error(core::error_code::invalid_range,
                                          "non-numeric range bound on '" + r.field + "'"));
    }
    if (less(*hi, *lo)) {
        return std::unexpected(make_error(core::error_code::invalid_range,
                                          "range min exceeds max on '" + r.field + "'"));
    }
    return numeric_range(a, *lo, *hi, cfg);
}

} // namespace

auto attribute_name(Attribute a) noexcept -> std::string_view {
    return names[attribute_index(a)];
}

auto attribute_from_name(std::string_view name) noexcept -> std::optional<Attribute> {
    for (auto a : all_attributes) {
        if (names[attribute_index(a)] == name) return a;
    }
    return std::nullopt;
}

auto attribute_kind(Attribute a) noexcept -> AttributeKind {
    switch (a) {
        case Attribute::bedrooms: return AttributeKind::discrete;
        case Attribute::bathrooms: return AttributeKind::half_step;
        case Attribute::price:
        case Attribute::year_built: return AttributeKind::bucketed;
        case Attribute::has_basement:
        case Attribute::has_fireplace:
        case Attribute::has_attic:
        case Attribute::has_garage: return AttributeKind::flag;
    }
    return AttributeKind::discrete;
}

auto attribute_key(const Property& p, Attribute a, const IndexConfig& cfg) noexcept -> AttributeKey {
    switch (a) {
        case Attribute::bedrooms: return p.bedrooms;
        case Attribute::bathrooms: return static_cast<AttributeKey>(std::llround(p.bathrooms * 2.0));
        case Attribute::price: return p.price / cfg.price_bucket_width;
        case Attribute::year_built: return p.year_built / cfg.year_bucket_width;
        case Attribute::has_basement: return p.has_basement ? 1 : 0;
        case Attribute::has_fireplace: return p.has_fireplace ? 1 : 0;
        case Attribute::has_attic: return p.has_attic ? 1 : 0;
        case Attribute::has_garage: return p.has_garage ? 1 : 0;
    }
    return 0;
}

auto bucketed_value(const Property& p, Attribute a) noexcept -> std::int64_t {
    return a == Attribute::price ? p.price : static_cast<std::int64_t>(p.year_built);
}

auto resolve_filter(const query_filter& filter, const IndexConfig& cfg)
    -> std::expected<std::vector<KeyRange>, core::error> {
    std::vector<KeyRange> out;
    out.reserve(filter.predicates.size() + filter.required_flags.size());

    for (const auto& pred : filter.predicates) {
        auto resolved = std::visit([&](const auto& node) -> std::expected<KeyRange, core::error> {
            using T = std::decay_t<decltype(node)>;
            auto attr = attribute_from_name(node.field);
            if (!attr) {
                return std::unexpected(make_error(core::error_code::unknown_attribute,
                                                  "unknown attribute '" + node.field + "'"));
            }
            if constexpr (std::is_same_v<T, term>) {
                return resolve_term(*attr, node, cfg);
            } else {
                return resolve_range(*attr, node, cfg);
            }
        }, pred);
        if (!resolved) return std::unexpected(resolved.error());
        out.push_back(*resolved);
    }

    for (const auto& flag : filter.required_flags) {
        auto attr = attribute_from_name(flag);
        if (!attr || attribute_kind(*attr) != AttributeKind::flag) {
            return std::unexpected(make_error(core::error_code::unknown_attribute,
                                              "unknown feature flag '" + flag + "'"));
        }
        out.push_back(KeyRange{*attr, 1, 1, std::nullopt});
    }
    return out;
}

} // namespace homeindex
