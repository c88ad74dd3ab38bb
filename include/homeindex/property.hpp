#pragma once

/** \file property.hpp
 *  \brief Property records and the immutable store that numbers them.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "homeindex/error.hpp"

namespace homeindex {

/** \brief Dense identifier equal to the record's insertion position. */
using PropertyId = std::uint32_t;

/** \brief One real-estate record. latitude/longitude are carried, never indexed. */
struct Property {
    PropertyId id{0};
    std::int32_t bedrooms{0};
    double bathrooms{0.0};        /**< half-bath granularity */
    std::int64_t price{0};        /**< currency units, positive */
    std::int32_t year_built{0};
    double latitude{0.0};
    double longitude{0.0};
    bool has_basement{false};
    bool has_fireplace{false};
    bool has_attic{false};
    bool has_garage{false};
};

inline constexpr std::int32_t min_plausible_year = 1700;
inline constexpr std::int32_t max_plausible_year = 2100;

/** \brief Ordered immutable collection of properties.
 *
 * Ids are reassigned to 0..n-1 in input order at construction.
 * Thread-safety: immutable after create(); safe for concurrent reads.
 */
class PropertyStore {
public:
    PropertyStore() = default;

    /** \brief Validate and number a batch of records.
     *
     * \return store, or invalid_argument naming the first offending record
     */
    static auto create(std::vector<Property> records)
        -> std::expected<PropertyStore, core::error>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return records_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return records_.empty(); }

    /** \brief Record by id. Precondition: id < size(). */
    [[nodiscard]] auto operator[](PropertyId id) const noexcept -> const Property& {
        return records_[id];
    }

    [[nodiscard]] auto records() const noexcept -> std::span<const Property> { return records_; }

    auto begin() const noexcept { return records_.begin(); }
    auto end() const noexcept { return records_.end(); }

private:
    explicit PropertyStore(std::vector<Property> records) : records_(std::move(records)) {}

    std::vector<Property> records_;
};

} // namespace homeindex
