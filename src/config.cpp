#include "homeindex/config.hpp"
#include "homeindex/core/platform_utils.hpp"

#include <string>

namespace homeindex {

auto to_string(merge_strategy m) noexcept -> std::string_view {
    switch (m) {
        case merge_strategy::pairwise: return "pairwise";
        case merge_strategy::heap: return "heap";
    }
    return "pairwise";
}

auto IndexConfig::validate() const -> std::expected<void, core::error> {
    if (price_bucket_width <= 0) {
        return std::unexpected(core::error{core::error_code::config_invalid,
                                           "price_bucket_width must be positive",
                                           "config"});
    }
    if (year_bucket_width <= 0) {
        return std::unexpected(core::error{core::error_code::config_invalid,
                                           "year_bucket_width must be positive",
                                           "config"});
    }
    return {};
}

auto IndexConfig::from_env() -> std::expected<IndexConfig, core::error> {
    IndexConfig cfg{};
    if (auto v = core::env_positive_int("HOMEINDEX_PRICE_BUCKET")) {
        if (*v == 0) {
            return std::unexpected(core::error{core::error_code::config_invalid,
                                               "HOMEINDEX_PRICE_BUCKET must be a positive integer",
                                               "config.from_env"});
        }
        cfg.price_bucket_width = *v;
    }
    if (auto v = core::env_positive_int("HOMEINDEX_YEAR_BUCKET")) {
        if (*v == 0) {
            return std::unexpected(core::error{core::error_code::config_invalid,
                                               "HOMEINDEX_YEAR_BUCKET must be a positive integer",
                                               "config.from_env"});
        }
        cfg.year_bucket_width = *v;
    }
    if (auto m = core::safe_getenv("HOMEINDEX_MERGE")) {
        if (*m == "pairwise") {
            cfg.merge = merge_strategy::pairwise;
        } else if (*m == "heap") {
            cfg.merge = merge_strategy::heap;
        } else {
            return std::unexpected(core::error{core::error_code::config_invalid,
                                               "HOMEINDEX_MERGE must be 'pairwise' or 'heap', got '" + *m + "'",
                                               "config.from_env"});
        }
    }
    if (auto ok = cfg.validate(); !ok) return std::unexpected(ok.error());
    return cfg;
}

} // namespace homeindex
