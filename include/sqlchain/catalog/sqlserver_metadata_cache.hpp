#pragma once

#include "sqlchain/catalog/metadata_cache.hpp"

namespace sqlchain::catalog {

// Reads sys.objects, sys.columns and sys.parameters.
class SqlServerMetadataCache final : public MetadataCache {
public:
    using MetadataCache::MetadataCache;

protected:
    [[nodiscard]] TablePtr discover_table_or_view(const ObjectName& name) override;
    [[nodiscard]] ProcedurePtr discover_stored_procedure(const ObjectName& name) override;
    [[nodiscard]] std::vector<ObjectName> list_objects(bool tables) override;
};

}  // namespace sqlchain::catalog
