#pragma once

#include "sqlchain/catalog/metadata_cache.hpp"

namespace sqlchain::catalog {

// Unknown names are not an error here: get_table_or_view() returns nullptr
// and the absence is remembered like any other result.
class SqliteMetadataCache final : public MetadataCache {
public:
    using MetadataCache::MetadataCache;

    [[nodiscard]] bool reports_absence() const noexcept override { return true; }

protected:
    [[nodiscard]] TablePtr discover_table_or_view(const ObjectName& name) override;
    [[nodiscard]] std::vector<ObjectName> list_objects(bool tables) override;
};

}  // namespace sqlchain::catalog
