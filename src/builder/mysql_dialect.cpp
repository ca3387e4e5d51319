#include "sqlchain/builder/mysql_dialect.hpp"

#include "type_names.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/identifier.hpp"

#include <utility>

namespace sqlchain::builder {

std::string MySqlDialect::quote_identifier(std::string_view identifier) const
{
    return quote_with(identifier, '`', '`');
}

core::ValueKind MySqlDialect::value_kind_for(std::string_view type_name) const
{
    const auto full = core::to_lower_copy(type_name);
    if (full.starts_with("tinyint(1)") || full.starts_with("bit(1)")) {
        return core::ValueKind::Boolean;
    }
    const auto base = detail::base_type_name(type_name);
    if (base == "bool" || base == "boolean") {
        return core::ValueKind::Boolean;
    }
    if (base == "tinyint" || base == "smallint" || base == "mediumint" || base == "int" || base == "integer") {
        return core::ValueKind::Int32;
    }
    if (base == "bigint") {
        return core::ValueKind::Int64;
    }
    if (base == "float" || base == "double" || base == "decimal" || base == "numeric" || base == "real") {
        return core::ValueKind::Double;
    }
    if (base.find("blob") != std::string::npos || base == "binary" || base == "varbinary") {
        return core::ValueKind::Binary;
    }
    return core::ValueKind::String;
}

execution::ExecutionToken MySqlDialect::prepare_upsert(const StatementContext& context) const
{
    auto builder = make_builder(context);
    builder.apply_argument_value(context.descriptor.values(), key_source_for(context),
                                 context.descriptor.match_columns());
    builder.require_key_values("Upsert");

    const auto insert_columns = builder.upsert_insert_columns();
    const auto update_columns = builder.update_columns();
    if (update_columns.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "No updatable columns were supplied for " + context.table.name().to_string());
    }

    ParameterList parameters;
    std::string head{"INSERT INTO "};
    head.append(context.table.quoted_name());
    head.push_back(' ');
    SqlBuilder::append_column_list(head, insert_columns);
    head.append(" VALUES ");
    SqlBuilder::append_value_list(head, insert_columns, parameters);
    head.append(" ON DUPLICATE KEY UPDATE ");
    bool first = true;
    for (const auto* entry : update_columns) {
        if (!first) {
            head.append(", ");
        }
        first = false;
        head.append(entry->column->quoted_sql_name());
        head.append(" = VALUES(");
        head.append(entry->column->quoted_sql_name());
        head.push_back(')');
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

void MySqlDialect::append_random_order(std::string& sql,
                                       const StatementContext& context,
                                       ParameterList& parameters) const
{
    const auto& paging = context.descriptor.paging();
    if (!paging.seed) {
        sql.append(" ORDER BY RAND()");
        return;
    }
    sql.append(" ORDER BY RAND(");
    sql.append(parameters.add("random_seed", *paging.seed));
    sql.push_back(')');
}

std::string MySqlDialect::inserted_row_predicate(const SqlBuilder& builder, ParameterList& parameters) const
{
    const auto* identity = builder.identity_column();
    if (identity == nullptr || identity->has_value) {
        return SqlDialect::inserted_row_predicate(builder, parameters);
    }
    std::string predicate{" WHERE "};
    predicate.append(identity->column->quoted_sql_name());
    predicate.append(" = LAST_INSERT_ID()");
    return predicate;
}

}  // namespace sqlchain::builder
