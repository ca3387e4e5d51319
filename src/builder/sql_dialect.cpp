#include "sqlchain/builder/sql_dialect.hpp"

#include "sqlchain/core/chain_errors.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::builder {

std::string quote_with(std::string_view identifier, char open, char close)
{
    std::string quoted;
    quoted.reserve(identifier.size() + 2U);
    quoted.push_back(open);
    for (const char ch : identifier) {
        quoted.push_back(ch);
        if (ch == close) {
            quoted.push_back(close);
        }
    }
    quoted.push_back(close);
    return quoted;
}

std::string SqlDialect::quote_name(const catalog::ObjectName& name) const
{
    if (!name.has_schema()) {
        return quote_identifier(name.name);
    }
    return quote_identifier(name.schema) + "." + quote_identifier(name.name);
}

catalog::ObjectName SqlDialect::normalize_name(const catalog::ObjectName& name) const
{
    return name;
}

execution::LockMode SqlDialect::lock_mode_for(OperationKind) const noexcept
{
    return execution::LockMode::None;
}

execution::ExecutionToken SqlDialect::prepare(const StatementContext& context) const
{
    switch (context.descriptor.kind()) {
    case OperationKind::Query:
        return prepare_query(context);
    case OperationKind::Insert:
        return prepare_insert(context);
    case OperationKind::Update:
        return prepare_update(context);
    case OperationKind::UpdateSet:
        return prepare_update_set(context);
    case OperationKind::Upsert:
        return prepare_upsert(context);
    case OperationKind::Delete:
        return prepare_delete(context);
    case OperationKind::DeleteSet:
        return prepare_delete_set(context);
    }
    throw std::invalid_argument{"Unknown operation kind"};
}

execution::ExecutionToken SqlDialect::prepare_query(const StatementContext& context) const
{
    if (context.desired.is_none()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "A query against " + context.table.name().to_string()
                                    + " must read at least one column");
    }

    auto builder = make_builder(context);
    validate_paging(context);

    ParameterList parameters;
    std::string where;
    builder.append_filter(where, context.descriptor.filter(), parameters);

    std::string sql{"SELECT "};
    append_top(sql, context, parameters);
    builder.append_select_list(sql);
    sql.append(" FROM ");
    sql.append(context.table.quoted_name());
    append_table_sample(sql, context, parameters);
    sql.append(where);
    if (!context.descriptor.sort().empty()) {
        append_sort(sql, context);
    } else if (context.descriptor.paging().strategy == LimitStrategy::RandomSample) {
        append_random_order(sql, context, parameters);
    }
    append_limits(sql, context, parameters);
    sql.push_back(';');

    return make_token(context, std::move(sql), std::move(parameters), true, std::nullopt);
}

execution::ExecutionToken SqlDialect::prepare_insert(const StatementContext& context) const
{
    auto builder = make_builder(context);
    builder.apply_argument_value(context.descriptor.values(), KeySource::PrimaryKey);

    ParameterList parameters;
    std::string head{"INSERT INTO "};
    head.append(context.table.quoted_name());
    head.push_back(' ');
    builder.append_insert_columns(head);

    std::string tail{" VALUES "};
    builder.append_insert_values(tail, parameters);

    return finish_write(context, builder, std::move(head), tail, std::move(parameters), RowImage::New,
                        [this, &builder](ParameterList& read_parameters) {
                            return inserted_row_predicate(builder, read_parameters);
                        });
}

execution::ExecutionToken SqlDialect::prepare_update(const StatementContext& context) const
{
    auto builder = make_builder(context);
    builder.apply_argument_value(context.descriptor.values(), key_source_for(context));
    builder.require_key_values("Update");

    const auto key_predicate = [&builder](ParameterList& parameters) {
        std::string predicate{" WHERE "};
        builder.append_key_predicate(predicate, parameters);
        return predicate;
    };

    ParameterList parameters;
    std::string head{"UPDATE "};
    head.append(context.table.quoted_name());
    head.append(" SET ");
    builder.append_set_clause(head, parameters);
    const auto tail = key_predicate(parameters);

    const auto image = has_flag(context.descriptor.options(), WriteOptions::ReturnOldValues) ? RowImage::Old
                                                                                              : RowImage::New;
    return finish_write(context, builder, std::move(head), tail, std::move(parameters), image, key_predicate);
}

execution::ExecutionToken SqlDialect::prepare_update_set(const StatementContext& context) const
{
    auto builder = make_builder(context);

    // The filter binds first so generated SET names step around caller-named parameters.
    ParameterList parameters;
    const auto tail = set_predicate(context, builder, parameters);

    std::string head{"UPDATE "};
    head.append(context.table.quoted_name());
    head.append(" SET ");
    if (const auto& expression = context.descriptor.update_expression()) {
        bind_raw_arguments(expression->text, expression->arguments, {}, context.strict_mode, parameters);
        head.append(expression->text);
    } else {
        builder.apply_argument_value(context.descriptor.values(), KeySource::PrimaryKey);
        builder.append_set_clause(head, parameters);
    }

    const auto image = has_flag(context.descriptor.options(), WriteOptions::ReturnOldValues) ? RowImage::Old
                                                                                              : RowImage::New;
    return finish_write(context, builder, std::move(head), tail, std::move(parameters), image,
                        [&context, &builder](ParameterList& read_parameters) {
                            return set_predicate(context, builder, read_parameters);
                        });
}

execution::ExecutionToken SqlDialect::prepare_delete(const StatementContext& context) const
{
    auto builder = make_builder(context);
    builder.apply_argument_value(context.descriptor.values(), key_source_for(context));
    builder.require_key_values("Delete");

    const auto key_predicate = [&builder](ParameterList& parameters) {
        std::string predicate{" WHERE "};
        builder.append_key_predicate(predicate, parameters);
        return predicate;
    };

    ParameterList parameters;
    std::string head{"DELETE FROM "};
    head.append(context.table.quoted_name());
    const auto tail = key_predicate(parameters);

    return finish_write(context, builder, std::move(head), tail, std::move(parameters), RowImage::Deleted,
                        key_predicate);
}

execution::ExecutionToken SqlDialect::prepare_delete_set(const StatementContext& context) const
{
    auto builder = make_builder(context);

    ParameterList parameters;
    const auto tail = set_predicate(context, builder, parameters);

    std::string head{"DELETE FROM "};
    head.append(context.table.quoted_name());

    return finish_write(context, builder, std::move(head), tail, std::move(parameters), RowImage::Deleted,
                        [&context, &builder](ParameterList& read_parameters) {
                            return set_predicate(context, builder, read_parameters);
                        });
}

void SqlDialect::validate_paging(const StatementContext& context) const
{
    const auto& paging = context.descriptor.paging();
    switch (paging.strategy) {
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
        if (!context.descriptor.sort().empty()) {
            core::throw_chain_error(core::ChainErrc::UnsupportedOperation,
                                    "Random sampling cannot be combined with sorting on the "
                                        + std::string{name()} + " dialect");
        }
        break;
    case LimitStrategy::None:
    case LimitStrategy::Offset:
        break;
    }
}

void SqlDialect::append_top(std::string&, const StatementContext&, ParameterList&) const
{
}

void SqlDialect::append_table_sample(std::string&, const StatementContext&, ParameterList&) const
{
}

void SqlDialect::append_limits(std::string& sql, const StatementContext& context, ParameterList& parameters) const
{
    const auto& paging = context.descriptor.paging();
    if (paging.strategy == LimitStrategy::None) {
        return;
    }
    if (paging.take) {
        sql.append(" LIMIT ");
        sql.append(parameters.add("fetch_row_count", *paging.take));
    }
    if (paging.strategy == LimitStrategy::Offset && paging.skip) {
        if (!paging.take) {
            sql.append(unbounded_limit());
        }
        sql.append(" OFFSET ");
        sql.append(parameters.add("offset_row_count", *paging.skip));
    }
}

SqlBuilder SqlDialect::make_builder(const StatementContext& context) const
{
    SqlBuilder builder{context.table, context.strict_mode};
    if (!context.desired.is_none()) {
        builder.apply_desired_columns(context.desired);
    }
    return builder;
}

KeySource SqlDialect::key_source_for(const StatementContext& context) const noexcept
{
    const auto& descriptor = context.descriptor;
    if (descriptor.kind() == OperationKind::Upsert && !descriptor.match_columns().empty()) {
        return KeySource::MatchColumns;
    }
    if (has_flag(descriptor.options(), WriteOptions::UseKeyAttribute)) {
        return KeySource::KeyAttribute;
    }
    return KeySource::PrimaryKey;
}

std::string SqlDialect::operation_name(const StatementContext& context)
{
    std::string name{to_string(context.descriptor.kind())};
    name.push_back(' ');
    name.append(context.table.name().to_string());
    return name;
}

execution::ExecutionToken SqlDialect::make_token(const StatementContext& context,
                                                 std::string sql,
                                                 ParameterList parameters,
                                                 bool reads_rows,
                                                 std::optional<std::int64_t> expected_row_count) const
{
    execution::ExecutionToken::Spec spec{};
    spec.operation_name = operation_name(context);
    spec.command_text = std::move(sql);
    spec.parameters = std::move(parameters).release();
    spec.mode = reads_rows ? execution::ExecutionMode::Reader : execution::ExecutionMode::NonQuery;
    spec.lock_mode = lock_mode_for(context.descriptor.kind());
    spec.expected_row_count = expected_row_count;
    return execution::ExecutionToken{std::move(spec)};
}

execution::ExecutionToken SqlDialect::make_read_token(const StatementContext& context,
                                                      const SqlBuilder& builder,
                                                      const std::string& predicate,
                                                      ParameterList parameters) const
{
    std::string sql{"SELECT "};
    builder.append_select_list(sql);
    sql.append(" FROM ");
    sql.append(context.table.quoted_name());
    sql.append(predicate);
    sql.push_back(';');

    execution::ExecutionToken::Spec spec{};
    spec.operation_name = operation_name(context) + " (read back)";
    spec.command_text = std::move(sql);
    spec.parameters = std::move(parameters).release();
    spec.mode = execution::ExecutionMode::Reader;
    spec.lock_mode = lock_mode_for(OperationKind::Query);
    return execution::ExecutionToken{std::move(spec)};
}

execution::ExecutionToken SqlDialect::finish_write(
    const StatementContext& context,
    const SqlBuilder& builder,
    std::string head,
    const std::string& tail,
    ParameterList parameters,
    RowImage image,
    const std::function<std::string(ParameterList&)>& read_predicate) const
{
    const bool reads = builder.has_read_columns();
    const auto expected = context.descriptor.expected_row_count();

    if (reads && output_style() == OutputStyle::Inline) {
        head.append(" OUTPUT ");
        builder.append_select_list(head, image == RowImage::New ? "Inserted." : "Deleted.");
        head.append(tail);
        head.push_back(';');
        return make_token(context, std::move(head), std::move(parameters), true, expected);
    }
    if (reads && output_style() == OutputStyle::Returning && image != RowImage::Old) {
        head.append(tail);
        head.append(" RETURNING ");
        builder.append_select_list(head);
        head.push_back(';');
        return make_token(context, std::move(head), std::move(parameters), true, expected);
    }

    head.append(tail);
    head.push_back(';');
    auto write = make_token(context, std::move(head), std::move(parameters), false, expected);
    if (!reads) {
        return write;
    }

    ParameterList read_parameters;
    const auto predicate = read_predicate(read_parameters);
    auto read = make_read_token(context, builder, predicate, std::move(read_parameters));
    return chain(std::move(write), std::move(read), image != RowImage::New);
}

execution::ExecutionToken SqlDialect::chain(execution::ExecutionToken write,
                                            execution::ExecutionToken read,
                                            bool read_first)
{
    if (read_first) {
        return std::move(read).then(std::move(write));
    }
    return std::move(write).then(std::move(read));
}

std::string SqlDialect::set_predicate(const StatementContext& context,
                                      const SqlBuilder& builder,
                                      ParameterList& parameters)
{
    const auto& descriptor = context.descriptor;
    if (!descriptor.has_filter()) {
        throw std::invalid_argument{std::string{to_string(descriptor.kind())} + " on "
                                    + context.table.name().to_string() + " requires a filter"};
    }
    std::string predicate;
    builder.append_filter(predicate, descriptor.filter(), parameters);
    if (predicate.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "The filter for " + std::string{to_string(descriptor.kind())} + " on "
                                    + context.table.name().to_string() + " has no non-null values");
    }
    return predicate;
}

std::string SqlDialect::inserted_row_predicate(const SqlBuilder& builder, ParameterList& parameters) const
{
    builder.require_key_values("Insert");
    std::string predicate{" WHERE "};
    builder.append_key_predicate(predicate, parameters);
    return predicate;
}

execution::ExecutionToken SqlDialect::prepare_on_conflict_upsert(const StatementContext& context,
                                                                 std::string_view excluded) const
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
    head.append(" ON CONFLICT ");
    SqlBuilder::append_column_list(head, builder.key_columns());
    head.append(" DO UPDATE SET ");
    bool first = true;
    for (const auto* entry : update_columns) {
        if (!first) {
            head.append(", ");
        }
        first = false;
        head.append(entry->column->quoted_sql_name());
        head.append(" = ");
        head.append(excluded);
        head.push_back('.');
        head.append(entry->column->quoted_sql_name());
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

void SqlDialect::append_sort(std::string& sql, const StatementContext& context)
{
    bool first = true;
    for (const auto& expression : context.descriptor.sort()) {
        const auto* column = context.table.try_get_column(expression.column);
        if (column == nullptr) {
            core::throw_chain_error(core::ChainErrc::MappingFailed,
                                    "Cannot sort on " + expression.column + " because it is not a column of "
                                        + context.table.name().to_string());
        }
        sql.append(first ? " ORDER BY " : ", ");
        first = false;
        sql.append(column->quoted_sql_name());
        if (expression.direction == SortDirection::Descending) {
            sql.append(" DESC");
        }
    }
}

}  // namespace sqlchain::builder
