#include "sqlchain/catalog/postgresql_metadata_cache.hpp"

#include <utility>

namespace sqlchain::catalog {

namespace {

constexpr std::string_view kObjectQuery =
    "SELECT table_schema AS SchemaName, table_name AS Name, "
    "CASE WHEN table_type = 'BASE TABLE' THEN 1 ELSE 0 END AS IsTable "
    "FROM information_schema.tables "
    "WHERE lower(table_schema) = lower(@Schema) AND lower(table_name) = lower(@Name);";

constexpr std::string_view kColumnQuery =
    "SELECT c.column_name AS ColumnName, c.data_type AS TypeName, "
    "CASE WHEN c.is_nullable = 'YES' THEN 1 ELSE 0 END AS IsNullable, "
    "CASE WHEN c.is_identity = 'YES' OR c.column_default LIKE 'nextval(%' THEN 1 ELSE 0 END AS IsIdentity, "
    "CASE WHEN c.is_generated = 'ALWAYS' THEN 1 ELSE 0 END AS IsComputed, "
    "CASE WHEN pk.column_name IS NULL THEN 0 ELSE 1 END AS IsPrimaryKey "
    "FROM information_schema.columns c "
    "LEFT JOIN (SELECT kcu.table_schema, kcu.table_name, kcu.column_name "
    "FROM information_schema.table_constraints tc "
    "INNER JOIN information_schema.key_column_usage kcu ON tc.constraint_name = kcu.constraint_name "
    "AND tc.table_schema = kcu.table_schema AND tc.table_name = kcu.table_name "
    "WHERE tc.constraint_type = 'PRIMARY KEY') pk "
    "ON pk.table_schema = c.table_schema AND pk.table_name = c.table_name AND pk.column_name = c.column_name "
    "WHERE c.table_schema = @Schema AND c.table_name = @Name "
    "ORDER BY c.ordinal_position;";

constexpr std::string_view kListQuery =
    "SELECT table_schema AS SchemaName, table_name AS Name "
    "FROM information_schema.tables "
    "WHERE table_type = @Type AND table_schema NOT IN ('pg_catalog', 'information_schema') "
    "ORDER BY table_schema, table_name;";

}  // namespace

MetadataCache::TablePtr PostgreSqlMetadataCache::discover_table_or_view(const ObjectName& name)
{
    const auto objects = query(kObjectQuery, {execution::SqlParameter{"@Schema", name.schema, std::nullopt},
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

std::vector<ObjectName> PostgreSqlMetadataCache::list_objects(bool tables)
{
    std::vector<ObjectName> names;
    const auto* type = tables ? "BASE TABLE" : "VIEW";
    for (const auto& row : query(kListQuery, {execution::SqlParameter{"@Type", type, std::nullopt}})) {
        names.push_back(ObjectName{text_of(row, "SchemaName"), text_of(row, "Name")});
    }
    return names;
}

}  // namespace sqlchain::catalog
