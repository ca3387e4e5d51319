#include "sqlchain/catalog/sqlserver_metadata_cache.hpp"

#include "sqlchain/builder/sql_dialect.hpp"

#include <utility>

namespace sqlchain::catalog {

namespace {

constexpr std::string_view kObjectQuery =
    "SELECT s.name AS SchemaName, o.name AS Name, "
    "CAST(CASE WHEN o.type = 'U' THEN 1 ELSE 0 END AS bit) AS IsTable, o.object_id AS ObjectId "
    "FROM sys.objects o INNER JOIN sys.schemas s ON o.schema_id = s.schema_id "
    "WHERE o.type IN ('U', 'V') AND s.name = @Schema AND o.name = @Name;";

constexpr std::string_view kColumnQuery =
    "SELECT c.name AS ColumnName, t.name AS TypeName, c.is_nullable AS IsNullable, "
    "c.is_identity AS IsIdentity, c.is_computed AS IsComputed, "
    "CAST(CASE WHEN pk.column_id IS NULL THEN 0 ELSE 1 END AS bit) AS IsPrimaryKey "
    "FROM sys.columns c "
    "INNER JOIN sys.types t ON c.user_type_id = t.user_type_id "
    "LEFT JOIN (SELECT ic.object_id, ic.column_id FROM sys.index_columns ic "
    "INNER JOIN sys.indexes i ON ic.object_id = i.object_id AND ic.index_id = i.index_id "
    "WHERE i.is_primary_key = 1) pk ON pk.object_id = c.object_id AND pk.column_id = c.column_id "
    "WHERE c.object_id = @ObjectId "
    "ORDER BY c.column_id;";

constexpr std::string_view kProcedureQuery =
    "SELECT s.name AS SchemaName, o.name AS Name, o.object_id AS ObjectId "
    "FROM sys.objects o INNER JOIN sys.schemas s ON o.schema_id = s.schema_id "
    "WHERE o.type = 'P' AND s.name = @Schema AND o.name = @Name;";

constexpr std::string_view kParameterQuery =
    "SELECT p.name AS ParameterName, t.name AS TypeName, p.is_output AS IsOutput "
    "FROM sys.parameters p INNER JOIN sys.types t ON p.user_type_id = t.user_type_id "
    "WHERE p.object_id = @ObjectId "
    "ORDER BY p.parameter_id;";

constexpr std::string_view kListQuery =
    "SELECT s.name AS SchemaName, o.name AS Name "
    "FROM sys.objects o INNER JOIN sys.schemas s ON o.schema_id = s.schema_id "
    "WHERE o.type = @Type "
    "ORDER BY s.name, o.name;";

[[nodiscard]] std::vector<execution::SqlParameter> name_parameters(const ObjectName& name)
{
    return {execution::SqlParameter{"@Schema", name.schema, std::nullopt},
            execution::SqlParameter{"@Name", name.name, std::nullopt}};
}

}  // namespace

MetadataCache::TablePtr SqlServerMetadataCache::discover_table_or_view(const ObjectName& name)
{
    const auto objects = query(kObjectQuery, name_parameters(name));
    if (objects.empty()) {
        return nullptr;
    }
    const auto& object = objects.front();
    const auto object_id = integer_of(object, "ObjectId");

    auto columns = column_definitions(
        query(kColumnQuery, {execution::SqlParameter{"@ObjectId", object_id, std::nullopt}}));
    return make_table(ObjectName{text_of(object, "SchemaName"), text_of(object, "Name")},
                      flag_of(object, "IsTable"), std::move(columns));
}

MetadataCache::ProcedurePtr SqlServerMetadataCache::discover_stored_procedure(const ObjectName& name)
{
    const auto procedures = query(kProcedureQuery, name_parameters(name));
    if (procedures.empty()) {
        return nullptr;
    }
    const auto& procedure = procedures.front();
    const auto object_id = integer_of(procedure, "ObjectId");

    std::vector<ParameterMetadata> parameters;
    for (const auto& row : query(kParameterQuery, {execution::SqlParameter{"@ObjectId", object_id, std::nullopt}})) {
        ParameterMetadata parameter{};
        parameter.sql_name = text_of(row, "ParameterName");
        parameter.type_name = text_of(row, "TypeName");
        parameter.value_kind = dialect().value_kind_for(parameter.type_name);
        parameter.is_output = flag_of(row, "IsOutput");
        parameters.push_back(std::move(parameter));
    }
    return make_procedure(ObjectName{text_of(procedure, "SchemaName"), text_of(procedure, "Name")},
                          std::move(parameters));
}

std::vector<ObjectName> SqlServerMetadataCache::list_objects(bool tables)
{
    std::vector<ObjectName> names;
    for (const auto& row : query(kListQuery, {execution::SqlParameter{"@Type", tables ? "U" : "V", std::nullopt}})) {
        names.push_back(ObjectName{text_of(row, "SchemaName"), text_of(row, "Name")});
    }
    return names;
}

}  // namespace sqlchain::catalog
