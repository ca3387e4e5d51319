#include "sqlchain/builder/postgresql_dialect.hpp"

#include "type_names.hpp"
#include "sqlchain/core/chain_errors.hpp"

namespace sqlchain::builder {

std::string PostgreSqlDialect::quote_identifier(std::string_view identifier) const
{
    return quote_with(identifier, '"', '"');
}

catalog::ObjectName PostgreSqlDialect::normalize_name(const catalog::ObjectName& name) const
{
    if (name.has_schema()) {
        return name;
    }
    return catalog::ObjectName{"public", name.name};
}

core::ValueKind PostgreSqlDialect::value_kind_for(std::string_view type_name) const
{
    const auto base = detail::base_type_name(type_name);
    if (base == "boolean" || base == "bool") {
        return core::ValueKind::Boolean;
    }
    if (base == "smallint" || base == "integer" || base == "int" || base == "int2" || base == "int4") {
        return core::ValueKind::Int32;
    }
    if (base == "bigint" || base == "int8") {
        return core::ValueKind::Int64;
    }
    if (base == "real" || base == "double precision" || base == "numeric" || base == "decimal"
        || base == "float4" || base == "float8") {
        return core::ValueKind::Double;
    }
    if (base == "bytea") {
        return core::ValueKind::Binary;
    }
    return core::ValueKind::String;
}

execution::ExecutionToken PostgreSqlDialect::prepare_upsert(const StatementContext& context) const
{
    return prepare_on_conflict_upsert(context, "EXCLUDED");
}

void PostgreSqlDialect::append_random_order(std::string& sql,
                                            const StatementContext& context,
                                            ParameterList& parameters) const
{
    const auto& paging = context.descriptor.paging();
    if (!paging.seed) {
        sql.append(" ORDER BY random()");
        return;
    }
    if (!context.table.is_table()) {
        core::throw_chain_error(core::ChainErrc::UnsupportedOperation,
                                "Seeded random sampling is only available for tables, not the view "
                                    + context.table.name().to_string());
    }
    sql.append(" ORDER BY md5(ctid::text || CAST(");
    sql.append(parameters.add("random_seed", *paging.seed));
    sql.append(" AS text))");
}

}  // namespace sqlchain::builder
