#include "sqlchain/builder/sqlserver_dialect.hpp"

#include "type_names.hpp"
#include "sqlchain/core/chain_errors.hpp"

#include <string>
#include <utility>

namespace sqlchain::builder {

std::string SqlServerDialect::quote_identifier(std::string_view identifier) const
{
    return quote_with(identifier, '[', ']');
}

catalog::ObjectName SqlServerDialect::normalize_name(const catalog::ObjectName& name) const
{
    if (name.has_schema()) {
        return name;
    }
    return catalog::ObjectName{"dbo", name.name};
}

core::ValueKind SqlServerDialect::value_kind_for(std::string_view type_name) const
{
    const auto base = detail::base_type_name(type_name);
    if (base == "bit") {
        return core::ValueKind::Boolean;
    }
    if (base == "tinyint" || base == "smallint" || base == "int") {
        return core::ValueKind::Int32;
    }
    if (base == "bigint") {
        return core::ValueKind::Int64;
    }
    if (base == "real" || base == "float" || base == "decimal" || base == "numeric" || base == "money"
        || base == "smallmoney") {
        return core::ValueKind::Double;
    }
    if (base == "binary" || base == "varbinary" || base == "image" || base == "rowversion"
        || base == "timestamp") {
        return core::ValueKind::Binary;
    }
    return core::ValueKind::String;
}

execution::ExecutionToken SqlServerDialect::prepare_upsert(const StatementContext& context) const
{
    auto builder = make_builder(context);
    builder.apply_argument_value(context.descriptor.values(), key_source_for(context),
                                 context.descriptor.match_columns());
    builder.require_key_values("Upsert");

    const auto source_columns = builder.value_columns();
    const auto update_columns = builder.update_columns();
    const auto insert_columns = builder.insert_columns();
    if (update_columns.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "No updatable columns were supplied for " + context.table.name().to_string());
    }

    ParameterList parameters;
    std::string head{"MERGE INTO "};
    head.append(context.table.quoted_name());
    head.append(" target USING (VALUES ");
    SqlBuilder::append_value_list(head, source_columns, parameters);
    head.append(") AS source ");
    SqlBuilder::append_column_list(head, source_columns);

    head.append(" ON ");
    bool first = true;
    for (const auto* key : builder.key_columns()) {
        if (!first) {
            head.append(" AND ");
        }
        first = false;
        head.append("target.").append(key->column->quoted_sql_name());
        head.append(" = source.").append(key->column->quoted_sql_name());
    }

    head.append(" WHEN MATCHED THEN UPDATE SET ");
    first = true;
    for (const auto* entry : update_columns) {
        if (!first) {
            head.append(", ");
        }
        first = false;
        head.append(entry->column->quoted_sql_name());
        head.append(" = source.").append(entry->column->quoted_sql_name());
    }

    head.append(" WHEN NOT MATCHED THEN INSERT ");
    if (insert_columns.empty()) {
        head.append("DEFAULT VALUES");
    } else {
        SqlBuilder::append_column_list(head, insert_columns);
        head.append(" VALUES ");
        SqlBuilder::append_column_list(head, insert_columns, "source.");
    }

    const auto image = has_flag(context.descriptor.options(), WriteOptions::ReturnOldValues) ? RowImage::Old
                                                                                              : RowImage::New;
    return finish_write(context, builder, std::move(head), {}, std::move(parameters), image,
                        [&builder](ParameterList& read_parameters) {
                            std::string predicate{" WHERE "};
                            builder.append_key_predicate(predicate, read_parameters);
                            return predicate;
                        });
}

void SqlServerDialect::validate_paging(const StatementContext& context) const
{
    const auto& paging = context.descriptor.paging();
    switch (paging.strategy) {
    case LimitStrategy::Offset:
        if ((paging.skip || paging.take) && context.descriptor.sort().empty()) {
            core::throw_chain_error(core::ChainErrc::UnsupportedOperation,
                                    "SQL Server requires a sort order when using offset paging");
        }
        break;
    case LimitStrategy::Top:
        if (paging.skip) {
            core::throw_chain_error(core::ChainErrc::UnsupportedOperation,
                                    "Top-N limits cannot skip rows; use offset paging instead");
        }
        break;
    case LimitStrategy::RandomSample:
        if (paging.skip) {
            core::throw_chain_error(core::ChainErrc::UnsupportedOperation, "Random sampling cannot skip rows");
        }
        if (!paging.take) {
            core::throw_chain_error(core::ChainErrc::UnsupportedOperation,
                                    "SQL Server table sampling requires a row count");
        }
        break;
    case LimitStrategy::None:
        break;
    }
}

void SqlServerDialect::append_top(std::string& sql, const StatementContext& context, ParameterList& parameters) const
{
    const auto& paging = context.descriptor.paging();
    if ((paging.strategy == LimitStrategy::Top || paging.strategy == LimitStrategy::RandomSample) && paging.take) {
        sql.append("TOP (");
        sql.append(parameters.add("fetch_row_count", *paging.take));
        sql.append(") ");
    }
}

void SqlServerDialect::append_table_sample(std::string& sql,
                                           const StatementContext& context,
                                           ParameterList&) const
{
    const auto& paging = context.descriptor.paging();
    if (paging.strategy != LimitStrategy::RandomSample || !paging.take) {
        return;
    }
    // TABLESAMPLE only accepts constants.
    sql.append(" TABLESAMPLE SYSTEM (");
    sql.append(std::to_string(*paging.take));
    sql.append(" ROWS)");
    if (paging.seed) {
        sql.append(" REPEATABLE (");
        sql.append(std::to_string(*paging.seed));
        sql.push_back(')');
    }
}

void SqlServerDialect::append_random_order(std::string&, const StatementContext&, ParameterList&) const
{
}

void SqlServerDialect::append_limits(std::string& sql,
                                     const StatementContext& context,
                                     ParameterList& parameters) const
{
    const auto& paging = context.descriptor.paging();
    if (paging.strategy != LimitStrategy::Offset || (!paging.skip && !paging.take)) {
        return;
    }
    sql.append(" OFFSET ");
    sql.append(parameters.add("offset_row_count", paging.skip.value_or(0)));
    sql.append(" ROWS");
    if (paging.take) {
        sql.append(" FETCH NEXT ");
        sql.append(parameters.add("fetch_row_count", *paging.take));
        sql.append(" ROWS ONLY");
    }
}

}  // namespace sqlchain::builder
