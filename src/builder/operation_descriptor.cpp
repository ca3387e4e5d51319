#include "sqlchain/builder/operation_descriptor.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::builder {

namespace {

void require_target(const catalog::ObjectName& target)
{
    if (target.empty()) {
        throw std::invalid_argument{"OperationDescriptor requires a table or view name"};
    }
}

void require_values(const model::ArgumentValue& values, std::string_view operation)
{
    if (values.empty()) {
        throw std::invalid_argument{std::string{operation} + " requires an argument value"};
    }
}

}  // namespace

std::string_view to_string(OperationKind kind) noexcept
{
    switch (kind) {
    case OperationKind::Query:
        return "Query";
    case OperationKind::Insert:
        return "Insert";
    case OperationKind::Update:
        return "Update";
    case OperationKind::UpdateSet:
        return "UpdateSet";
    case OperationKind::Upsert:
        return "Upsert";
    case OperationKind::Delete:
        return "Delete";
    case OperationKind::DeleteSet:
        return "DeleteSet";
    default:
        return "Unknown";
    }
}

OperationDescriptor::OperationDescriptor(State state)
    : state_{std::make_shared<const State>(std::move(state))}
{}

OperationDescriptor OperationDescriptor::query(catalog::ObjectName target)
{
    require_target(target);
    State state{};
    state.kind = OperationKind::Query;
    state.target = std::move(target);
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::insert(catalog::ObjectName target, model::ArgumentValue values)
{
    require_target(target);
    require_values(values, "Insert");
    State state{};
    state.kind = OperationKind::Insert;
    state.target = std::move(target);
    state.values = std::move(values);
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::update(catalog::ObjectName target,
                                                model::ArgumentValue values,
                                                WriteOptions options)
{
    require_target(target);
    require_values(values, "Update");
    if (has_flag(options, WriteOptions::UseKeyAttribute) && !values.is_object()) {
        throw std::invalid_argument{"UseKeyAttribute requires an object argument"};
    }
    State state{};
    state.kind = OperationKind::Update;
    state.target = std::move(target);
    state.values = std::move(values);
    state.options = options;
    if (!has_flag(options, WriteOptions::IgnoreRowsAffected)) {
        state.expected_row_count = 1;
    }
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::update_set(catalog::ObjectName target, model::ArgumentValue values)
{
    require_target(target);
    require_values(values, "UpdateSet");
    State state{};
    state.kind = OperationKind::UpdateSet;
    state.target = std::move(target);
    state.values = std::move(values);
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::update_set(catalog::ObjectName target, RawExpression expression)
{
    require_target(target);
    if (expression.text.empty()) {
        throw std::invalid_argument{"UpdateSet requires a SET expression"};
    }
    State state{};
    state.kind = OperationKind::UpdateSet;
    state.target = std::move(target);
    state.update_expression = std::move(expression);
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::upsert(catalog::ObjectName target,
                                                model::ArgumentValue values,
                                                WriteOptions options)
{
    require_target(target);
    require_values(values, "Upsert");
    if (has_flag(options, WriteOptions::UseKeyAttribute) && !values.is_object()) {
        throw std::invalid_argument{"UseKeyAttribute requires an object argument"};
    }
    State state{};
    state.kind = OperationKind::Upsert;
    state.target = std::move(target);
    state.values = std::move(values);
    state.options = options;
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::remove(catalog::ObjectName target,
                                                model::ArgumentValue key_values,
                                                WriteOptions options)
{
    require_target(target);
    require_values(key_values, "Delete");
    if (has_flag(options, WriteOptions::UseKeyAttribute) && !key_values.is_object()) {
        throw std::invalid_argument{"UseKeyAttribute requires an object argument"};
    }
    State state{};
    state.kind = OperationKind::Delete;
    state.target = std::move(target);
    state.values = std::move(key_values);
    state.options = options;
    if (!has_flag(options, WriteOptions::IgnoreRowsAffected)) {
        state.expected_row_count = 1;
    }
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::delete_set(catalog::ObjectName target)
{
    require_target(target);
    State state{};
    state.kind = OperationKind::DeleteSet;
    state.target = std::move(target);
    return OperationDescriptor{std::move(state)};
}

OperationDescriptor OperationDescriptor::derive(const std::function<void(State&)>& change) const
{
    State copy = *state_;
    change(copy);
    return OperationDescriptor{std::move(copy)};
}

OperationDescriptor OperationDescriptor::with_filter(model::ArgumentValue filter, FilterOptions options) const
{
    if (state_->kind == OperationKind::Insert || state_->kind == OperationKind::Upsert) {
        throw std::invalid_argument{std::string{to_string(state_->kind)} + " does not accept a filter"};
    }
    require_values(filter, "Filter");
    return derive([&](State& state) { state.filter = StructuredFilter{std::move(filter), options}; });
}

OperationDescriptor OperationDescriptor::with_where(std::string where_clause, model::ArgumentValue arguments) const
{
    if (state_->kind == OperationKind::Insert || state_->kind == OperationKind::Upsert) {
        throw std::invalid_argument{std::string{to_string(state_->kind)} + " does not accept a filter"};
    }
    if (where_clause.empty()) {
        throw std::invalid_argument{"WHERE clause text must not be empty"};
    }
    return derive([&](State& state) { state.filter = RawFilter{std::move(where_clause), std::move(arguments), {}}; });
}

OperationDescriptor OperationDescriptor::with_where(std::string where_clause,
                                                    std::vector<execution::SqlParameter> parameters) const
{
    if (state_->kind == OperationKind::Insert || state_->kind == OperationKind::Upsert) {
        throw std::invalid_argument{std::string{to_string(state_->kind)} + " does not accept a filter"};
    }
    if (where_clause.empty()) {
        throw std::invalid_argument{"WHERE clause text must not be empty"};
    }
    return derive([&](State& state) {
        state.filter = RawFilter{std::move(where_clause), model::ArgumentValue{}, std::move(parameters)};
    });
}

OperationDescriptor OperationDescriptor::with_sorting(std::vector<SortExpression> sort) const
{
    if (state_->kind != OperationKind::Query) {
        throw std::invalid_argument{"Sorting applies to queries only"};
    }
    for (const auto& expression : sort) {
        if (expression.column.empty()) {
            throw std::invalid_argument{"Sort expressions require a column name"};
        }
    }
    return derive([&](State& state) { state.sort = std::move(sort); });
}

OperationDescriptor OperationDescriptor::with_limits(std::optional<std::int64_t> skip,
                                                     std::optional<std::int64_t> take,
                                                     LimitStrategy strategy,
                                                     std::optional<std::int64_t> seed) const
{
    if (state_->kind != OperationKind::Query) {
        throw std::invalid_argument{"Limits apply to queries only"};
    }
    if ((skip && *skip < 0) || (take && *take < 0)) {
        throw std::invalid_argument{"Skip and take must not be negative"};
    }
    if (seed && strategy != LimitStrategy::RandomSample) {
        throw std::invalid_argument{"A seed applies to random sampling only"};
    }
    if (strategy == LimitStrategy::None && (skip || take)) {
        throw std::invalid_argument{"Skip or take requires a limit strategy"};
    }
    return derive([&](State& state) { state.paging = Paging{skip, take, strategy, seed}; });
}

OperationDescriptor OperationDescriptor::with_expected_row_count(std::int64_t rows) const
{
    if (!is_mutation(state_->kind)) {
        throw std::invalid_argument{"Row count expectations apply to mutations only"};
    }
    if (rows < 0) {
        throw std::invalid_argument{"Expected row count must not be negative"};
    }
    return derive([&](State& state) { state.expected_row_count = rows; });
}

OperationDescriptor OperationDescriptor::with_match_columns(std::vector<std::string> columns) const
{
    if (state_->kind != OperationKind::Upsert) {
        throw std::invalid_argument{"Match columns apply to upserts only"};
    }
    if (columns.empty()) {
        throw std::invalid_argument{"Match columns must not be empty"};
    }
    return derive([&](State& state) { state.match_columns = std::move(columns); });
}

OperationDescriptor OperationDescriptor::with_options(WriteOptions options) const
{
    if (!is_mutation(state_->kind)) {
        throw std::invalid_argument{"Write options apply to mutations only"};
    }
    if (has_flag(options, WriteOptions::UseKeyAttribute) && !state_->values.is_object()) {
        throw std::invalid_argument{"UseKeyAttribute requires an object argument"};
    }
    return derive([&](State& state) {
        state.options = options;
        if (state.kind == OperationKind::Update || state.kind == OperationKind::Delete) {
            if (has_flag(options, WriteOptions::IgnoreRowsAffected)) {
                state.expected_row_count.reset();
            } else if (!state.expected_row_count) {
                state.expected_row_count = 1;
            }
        }
    });
}

OperationKind OperationDescriptor::kind() const noexcept
{
    return state_->kind;
}

const catalog::ObjectName& OperationDescriptor::target() const noexcept
{
    return state_->target;
}

const model::ArgumentValue& OperationDescriptor::values() const noexcept
{
    return state_->values;
}

const std::optional<RawExpression>& OperationDescriptor::update_expression() const noexcept
{
    return state_->update_expression;
}

const Filter& OperationDescriptor::filter() const noexcept
{
    return state_->filter;
}

bool OperationDescriptor::has_filter() const noexcept
{
    return !std::holds_alternative<std::monostate>(state_->filter);
}

std::span<const SortExpression> OperationDescriptor::sort() const noexcept
{
    return state_->sort;
}

const Paging& OperationDescriptor::paging() const noexcept
{
    return state_->paging;
}

WriteOptions OperationDescriptor::options() const noexcept
{
    return state_->options;
}

std::optional<std::int64_t> OperationDescriptor::expected_row_count() const noexcept
{
    return state_->expected_row_count;
}

std::span<const std::string> OperationDescriptor::match_columns() const noexcept
{
    return state_->match_columns;
}

}  // namespace sqlchain::builder
