#include "sqlchain/catalog/sqlite_metadata_cache.hpp"

#include "sqlchain/builder/sql_dialect.hpp"
#include "sqlchain/core/identifier.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sqlchain::catalog {

namespace {

// Values of PRAGMA table_xinfo's `hidden` column.
constexpr std::int64_t kHiddenVirtualColumn = 1;
constexpr std::int64_t kGeneratedVirtualColumn = 2;
constexpr std::int64_t kGeneratedStoredColumn = 3;

}  // namespace

MetadataCache::TablePtr SqliteMetadataCache::discover_table_or_view(const ObjectName& name)
{
    std::string prefix;
    if (name.has_schema()) {
        prefix = dialect().quote_identifier(name.schema) + ".";
    }

    const auto objects = query("SELECT type AS ObjectType, name AS ObjectName FROM " + prefix
                                   + "sqlite_master WHERE name = @Name COLLATE NOCASE AND type IN ('table', 'view');",
                               {execution::SqlParameter{"@Name", name.name, std::nullopt}});
    if (objects.empty()) {
        return nullptr;
    }
    const auto& object = objects.front();
    ObjectName actual{name.schema, text_of(object, "ObjectName")};
    const bool is_table = core::iequals(text_of(object, "ObjectType"), "table");

    const auto rows = query("PRAGMA " + prefix + "table_xinfo(" + dialect().quote_identifier(actual.name) + ");");

    const auto key_count = std::count_if(rows.begin(), rows.end(), [](const core::ValueMap& row) {
        return integer_of(row, "pk") > 0;
    });

    std::vector<ColumnDefinition> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        const auto hidden = integer_of(row, "hidden");
        if (hidden == kHiddenVirtualColumn) {
            continue;
        }
        ColumnDefinition column{};
        column.name = text_of(row, "name");
        column.type_name = text_of(row, "type");
        column.value_kind = dialect().value_kind_for(column.type_name);
        column.is_primary_key = integer_of(row, "pk") > 0;
        // A lone INTEGER PRIMARY KEY aliases the rowid.
        column.is_identity = column.is_primary_key && key_count == 1
                             && core::iequals(column.type_name, "INTEGER");
        column.is_computed = hidden == kGeneratedVirtualColumn || hidden == kGeneratedStoredColumn;
        column.is_nullable = !flag_of(row, "notnull") && !column.is_identity;
        columns.push_back(std::move(column));
    }
    return make_table(std::move(actual), is_table, std::move(columns));
}

std::vector<ObjectName> SqliteMetadataCache::list_objects(bool tables)
{
    std::vector<ObjectName> names;
    const auto rows = query("SELECT name AS ObjectName FROM sqlite_master "
                            "WHERE type = @Type AND name NOT LIKE 'sqlite_%' ORDER BY name;",
                            {execution::SqlParameter{"@Type", tables ? "table" : "view", std::nullopt}});
    for (const auto& row : rows) {
        names.push_back(ObjectName{{}, text_of(row, "ObjectName")});
    }
    return names;
}

}  // namespace sqlchain::catalog
