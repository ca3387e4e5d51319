#include "sqlchain/builder/sqlite_dialect.hpp"

#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/identifier.hpp"

namespace sqlchain::builder {

std::string SqliteDialect::quote_identifier(std::string_view identifier) const
{
    return quote_with(identifier, '"', '"');
}

core::ValueKind SqliteDialect::value_kind_for(std::string_view type_name) const
{
    // Column affinity rules, checked in SQLite's own order. BOOL comes first
    // so declared booleans surface as such. Dates and times are stored as
    // ISO-8601 text, so their NUMERIC affinity is read back as a string.
    const auto upper = core::to_upper_copy(type_name);
    const auto contains = [&upper](std::string_view part) { return upper.find(part) != std::string::npos; };
    if (contains("BOOL")) {
        return core::ValueKind::Boolean;
    }
    if (contains("INT")) {
        return core::ValueKind::Int64;
    }
    if (contains("CHAR") || contains("CLOB") || contains("TEXT")) {
        return core::ValueKind::String;
    }
    if (contains("DATE") || contains("TIME")) {
        return core::ValueKind::String;
    }
    if (upper.empty() || contains("BLOB")) {
        return core::ValueKind::Binary;
    }
    return core::ValueKind::Double;
}

execution::LockMode SqliteDialect::lock_mode_for(OperationKind kind) const noexcept
{
    return is_mutation(kind) ? execution::LockMode::Write : execution::LockMode::Read;
}

execution::ExecutionToken SqliteDialect::prepare_upsert(const StatementContext& context) const
{
    return prepare_on_conflict_upsert(context, "excluded");
}

void SqliteDialect::append_random_order(std::string& sql,
                                        const StatementContext& context,
                                        ParameterList& parameters) const
{
    const auto& paging = context.descriptor.paging();
    if (!paging.seed) {
        sql.append(" ORDER BY RANDOM()");
        return;
    }
    if (!context.table.is_table()) {
        core::throw_chain_error(core::ChainErrc::UnsupportedOperation,
                                "Seeded random sampling needs a rowid and is not available for the view "
                                    + context.table.name().to_string());
    }
    sql.append(" ORDER BY ((_ROWID_ + ");
    sql.append(parameters.add("random_seed", *paging.seed));
    sql.append(") * 2654435761) % 4294967296");
}

}  // namespace sqlchain::builder
