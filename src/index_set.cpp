#include "homeindex/index_set.hpp"
#include "homeindex/core/platform_utils.hpp"

#include <iostream>

namespace homeindex {

auto build_indexes(std::vector<Property> properties, const IndexConfig& config)
    -> std::expected<IndexSet, core::error> {
    if (auto ok = config.validate(); !ok) return std::unexpected(ok.error());

    auto store = PropertyStore::create(std::move(properties));
    if (!store) return std::unexpected(store.error());
    if (store->empty()) {
        std::cerr << "[HOMEINDEX][build] warning: empty dataset, indexes will match nothing"
                  << std::endl;
    }

    auto hs = index::HashSetIndex::build(*store, config);
    if (!hs) return std::unexpected(hs.error());
    auto pl = index::PostingListIndex::build(*store, config);
    if (!pl) return std::unexpected(pl.error());

    if (core::debug_enabled()) {
        std::cerr << "[HOMEINDEX][build] index set ready n=" << store->size()
                  << " price_bucket=" << config.price_bucket_width
                  << " year_bucket=" << config.year_bucket_width << std::endl;
    }
    return IndexSet(std::move(*store), std::move(*hs), std::move(*pl), config);
}

} // namespace homeindex
