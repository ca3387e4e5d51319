#include "sqlchain/catalog/mysql_metadata_cache.hpp"

#include <optional>
#include <utility>

namespace sqlchain::catalog {

namespace {

constexpr std::string_view kObjectQuery =
    "SELECT TABLE_SCHEMA AS SchemaName, TABLE_NAME AS Name, "
    "CASE WHEN TABLE_TYPE = 'BASE TABLE' THEN 1 ELSE 0 END AS IsTable "
    "FROM INFORMATION_SCHEMA.TABLES "
    "WHERE TABLE_SCHEMA = COALESCE(@Schema, DATABASE()) AND TABLE_NAME = @Name;";

constexpr std::string_view kColumnQuery =
    "SELECT COLUMN_NAME AS ColumnName, COLUMN_TYPE AS TypeName, "
    "CASE WHEN IS_NULLABLE = 'YES' THEN 1 ELSE 0 END AS IsNullable, "
    "CASE WHEN EXTRA LIKE '%auto_increment%' THEN 1 ELSE 0 END AS IsIdentity, "
    "CASE WHEN EXTRA LIKE '%GENERATED%' THEN 1 ELSE 0 END AS IsComputed, "
    "CASE WHEN COLUMN_KEY = 'PRI' THEN 1 ELSE 0 END AS IsPrimaryKey "
    "FROM INFORMATION_SCHEMA.COLUMNS "
    "WHERE TABLE_SCHEMA = @Schema AND TABLE_NAME = @Name "
    "ORDER BY ORDINAL_POSITION;";

constexpr std::string_view kListQuery =
    "SELECT TABLE_SCHEMA AS SchemaName, TABLE_NAME AS Name "
    "FROM INFORMATION_SCHEMA.TABLES "
    "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = @Type "
    "ORDER BY TABLE_NAME;";

}  // namespace

MetadataCache::TablePtr MySqlMetadataCache::discover_table_or_view(const ObjectName& name)
{
    core::Value schema = name.has_schema() ? core::Value{name.schema} : core::Value{std::nullopt};
    const auto objects = query(kObjectQuery, {execution::SqlParameter{"@Schema", std::move(schema), std::nullopt},
                                              execution::SqlParameter{"@Name", name.name, std::nullopt}});
    if (objects.empty()) {
        return nullptr;
    }
    const auto& object = objects.front();
    ObjectName actual{text_of(object, "SchemaName"), text_of(object, "Name")};

    auto columns = column_definitions(
        query(kColumnQuery, {execution::SqlParameter{"@Schema", actual.schema, std::nullopt},
                             execution::SqlParameter{"@Name", actual.name, std::nullopt}}));
    return make_table(std::move(actual), flag_of(object, "IsTable"), std::move(columns));
}

std::vector<ObjectName> MySqlMetadataCache::list_objects(bool tables)
{
    std::vector<ObjectName> names;
    const auto* type = tables ? "BASE TABLE" : "VIEW";
    for (const auto& row : query(kListQuery, {execution::SqlParameter{"@Type", type, std::nullopt}})) {
        names.push_back(ObjectName{text_of(row, "SchemaName"), text_of(row, "Name")});
    }
    return names;
}

}  // namespace sqlchain::catalog
