#include "homeindex/property.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace homeindex {

namespace {

constexpr double max_half_baths = 9223372036854775808.0;

auto record_error(std::size_t pos, const char* what) -> core::error {
    return core::error{core::error_code::invalid_argument,
                       "record " + std::to_string(pos) + ": " + what,
                       "property_store.create"};
}

} // namespace

auto PropertyStore::create(std::vector<Property> records)
    -> std::expected<PropertyStore, core::error> {
    if (records.size() > std::numeric_limits<PropertyId>::max()) {
        return std::unexpected(core::error{core::error_code::precondition_failed,
                                           "record count exceeds 32-bit id space",
                                           "property_store.create"});
    }
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto& p = records[i];
        if (p.bedrooms < 0) return std::unexpected(record_error(i, "negative bedrooms"));
        if (!std::isfinite(p.bathrooms)) {
            return std::unexpected(record_error(i, "non-finite bathrooms"));
        }
        if (p.bathrooms < 0.0) return std::unexpected(record_error(i, "negative bathrooms"));
        const double halves = p.bathrooms * 2.0;
        // Half-bath keys are int64; 2^63 is the first value llround cannot represent.
        if (halves >= max_half_baths) {
            return std::unexpected(record_error(i, "bathrooms out of range"));
        }
        if (halves != std::floor(halves)) {
            return std::unexpected(record_error(i, "bathrooms not on half-bath granularity"));
        }
        if (p.price <= 0) return std::unexpected(record_error(i, "non-positive price"));
        if (p.year_built < min_plausible_year || p.year_built > max_plausible_year) {
            return std::unexpected(record_error(i, "implausible year_built"));
        }
        p.id = static_cast<PropertyId>(i);
    }
    return PropertyStore(std::move(records));
}

} // namespace homeindex
