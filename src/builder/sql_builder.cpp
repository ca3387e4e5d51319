#include "sqlchain/builder/sql_builder.hpp"

#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/identifier.hpp"
#include "sqlchain/parser/parameter_scanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sqlchain::builder {

namespace {

[[nodiscard]] std::string join_names(const std::vector<std::string>& names)
{
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined.append(", ");
        }
        joined.append(name);
    }
    return joined;
}

template <typename Predicate>
[[nodiscard]] SqlBuilder::EntryList select_entries(const std::vector<SqlBuilder::Entry>& entries, Predicate predicate)
{
    SqlBuilder::EntryList result;
    for (const auto& entry : entries) {
        if (predicate(entry)) {
            result.push_back(&entry);
        }
    }
    return result;
}

}  // namespace

std::string parameter_marker(std::string_view name)
{
    std::string marker;
    marker.reserve(name.size() + 1U);
    marker.push_back('@');
    marker.append(name);
    return marker;
}

std::string ParameterList::add(std::string_view name, core::Value value)
{
    auto marker = parameter_marker(name);
    for (int suffix = 2; contains(marker); ++suffix) {
        marker = parameter_marker(name) + "_" + std::to_string(suffix);
    }
    parameters_.push_back(execution::SqlParameter{marker, std::move(value), std::nullopt});
    return marker;
}

void ParameterList::add_exact(execution::SqlParameter parameter)
{
    if (parameter.name.empty()) {
        throw std::invalid_argument{"SQL parameters require a name"};
    }
    if (parameter.name.front() != '@') {
        parameter.name.insert(parameter.name.begin(), '@');
    }
    for (const auto& existing : parameters_) {
        if (core::iequals(existing.name, parameter.name)) {
            if (existing.value == parameter.value) {
                return;
            }
            throw std::invalid_argument{"Parameter " + parameter.name + " is bound twice with different values"};
        }
    }
    parameters_.push_back(std::move(parameter));
}

bool ParameterList::contains(std::string_view marker) const noexcept
{
    return std::any_of(parameters_.begin(), parameters_.end(), [&](const execution::SqlParameter& parameter) {
        return core::iequals(parameter.name, marker);
    });
}

SqlBuilder::SqlBuilder(const catalog::TableOrViewMetadata& table, bool strict_mode)
    : table_{&table}
    , strict_mode_{strict_mode}
{
    entries_.reserve(table.columns().size());
    for (const auto& column : table.columns()) {
        Entry entry{};
        entry.column = &column;
        entries_.push_back(std::move(entry));
    }
}

SqlBuilder::Entry* SqlBuilder::find_entry(const catalog::ColumnMetadata* column) noexcept
{
    for (auto& entry : entries_) {
        if (entry.column == column) {
            return &entry;
        }
    }
    return nullptr;
}

void SqlBuilder::apply_desired_columns(const materializer::DesiredColumns& desired)
{
    if (desired.is_none()) {
        return;
    }
    if (desired.is_all()) {
        for (auto& entry : entries_) {
            entry.use_for_read = true;
        }
        return;
    }

    std::vector<std::string> missing;
    bool matched = false;
    for (const auto& name : desired.names()) {
        const auto* column = table_->try_get_column(name);
        if (column == nullptr) {
            missing.push_back(name);
            continue;
        }
        find_entry(column)->use_for_read = true;
        matched = true;
    }

    if (strict_mode_ && !missing.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "The following desired columns were not found on " + table_->name().to_string() + ": "
                                    + join_names(missing));
    }
    if (!matched) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "None of the desired columns were found on " + table_->name().to_string() + ": "
                                    + join_names(missing));
    }
}

void SqlBuilder::apply_argument_value(const model::ArgumentValue& argument,
                                      KeySource keys,
                                      std::span<const std::string> match_columns)
{
    bool matched = false;
    if (argument.is_object()) {
        const auto& type = *argument.type();
        auto filter = catalog::PropertiesFilter::None;
        if (strict_mode_) {
            filter = filter | catalog::PropertiesFilter::ThrowOnMissingColumns;
        }
        const auto map = table_->properties_for(type, filter);
        for (const auto& pair : *map) {
            const auto* supplied = argument.find(*pair.property);
            if (supplied == nullptr) {
                continue;
            }
            auto* entry = find_entry(pair.column);
            entry->has_value = true;
            entry->value = supplied->value;
            if (keys == KeySource::KeyAttribute) {
                entry->is_key = pair.property->is_key();
            }
            matched = true;
        }
        if (keys == KeySource::KeyAttribute) {
            (void)table_->properties_for(type,
                                         catalog::PropertiesFilter::ObjectDefinedKey
                                             | catalog::PropertiesFilter::ThrowOnMissingColumns
                                             | catalog::PropertiesFilter::ThrowOnNoMatch);
        }
    } else {
        if (keys == KeySource::KeyAttribute) {
            throw std::invalid_argument{"Key attributes require an object argument"};
        }
        std::vector<std::string> missing;
        for (const auto& supplied : argument.entries()) {
            const auto* column = table_->try_get_column(supplied.name);
            if (column == nullptr) {
                missing.push_back(supplied.name);
                continue;
            }
            auto* entry = find_entry(column);
            entry->has_value = true;
            entry->value = supplied.value;
            matched = true;
        }
        if (strict_mode_ && !missing.empty()) {
            core::throw_chain_error(core::ChainErrc::MappingFailed,
                                    "The table " + table_->name().to_string()
                                        + " is missing a column mapped to the values: " + join_names(missing));
        }
    }

    if (!matched) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "None of the values in " + argument.describe() + " match a column on "
                                    + table_->name().to_string());
    }

    if (keys == KeySource::PrimaryKey) {
        for (auto& entry : entries_) {
            entry.is_key = entry.column->is_primary_key();
        }
    } else if (keys == KeySource::MatchColumns) {
        for (const auto& name : match_columns) {
            const auto* column = table_->try_get_column(name);
            if (column == nullptr) {
                core::throw_chain_error(core::ChainErrc::MappingFailed,
                                        "Match column " + name + " was not found on " + table_->name().to_string());
            }
            find_entry(column)->is_key = true;
        }
    }
}

void SqlBuilder::require_key_values(std::string_view operation) const
{
    std::vector<std::string> missing;
    bool any_key = false;
    for (const auto& entry : entries_) {
        if (!entry.is_key) {
            continue;
        }
        any_key = true;
        if (!entry.has_value) {
            missing.push_back(entry.column->sql_name());
        }
    }
    if (!any_key) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                std::string{operation} + " on " + table_->name().to_string()
                                    + " requires at least one key column");
    }
    if (!missing.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                std::string{operation} + " on " + table_->name().to_string()
                                    + " is missing a value for the key column(s): " + join_names(missing));
    }
}

bool SqlBuilder::has_read_columns() const noexcept
{
    return std::any_of(entries_.begin(), entries_.end(), [](const Entry& entry) { return entry.use_for_read; });
}

SqlBuilder::EntryList SqlBuilder::read_columns() const
{
    return select_entries(entries_, [](const Entry& entry) { return entry.use_for_read; });
}

SqlBuilder::EntryList SqlBuilder::key_columns() const
{
    return select_entries(entries_, [](const Entry& entry) { return entry.is_key; });
}

SqlBuilder::EntryList SqlBuilder::insert_columns() const
{
    return select_entries(entries_, [](const Entry& entry) {
        return entry.has_value && entry.column->is_updatable();
    });
}

SqlBuilder::EntryList SqlBuilder::update_columns() const
{
    return select_entries(entries_, [](const Entry& entry) {
        return entry.has_value && !entry.is_key && entry.column->is_updatable();
    });
}

SqlBuilder::EntryList SqlBuilder::value_columns() const
{
    return select_entries(entries_, [](const Entry& entry) { return entry.has_value; });
}

SqlBuilder::EntryList SqlBuilder::upsert_insert_columns() const
{
    return select_entries(entries_, [](const Entry& entry) {
        return entry.has_value && !entry.column->is_computed() && (!entry.column->is_identity() || entry.is_key);
    });
}

const SqlBuilder::Entry* SqlBuilder::identity_column() const noexcept
{
    for (const auto& entry : entries_) {
        if (entry.column->is_identity()) {
            return &entry;
        }
    }
    return nullptr;
}

void SqlBuilder::append_select_list(std::string& sql, std::string_view prefix) const
{
    bool first = true;
    for (const auto& entry : entries_) {
        if (!entry.use_for_read) {
            continue;
        }
        if (!first) {
            sql.append(", ");
        }
        first = false;
        sql.append(prefix);
        sql.append(entry.column->quoted_sql_name());
    }
}

void SqlBuilder::append_set_clause(std::string& sql, ParameterList& parameters) const
{
    const auto columns = update_columns();
    if (columns.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "No updatable columns were supplied for " + table_->name().to_string());
    }
    bool first = true;
    for (const auto* entry : columns) {
        if (!first) {
            sql.append(", ");
        }
        first = false;
        sql.append(entry->column->quoted_sql_name());
        sql.append(" = ");
        sql.append(parameters.add(entry->column->property_name(), entry->value));
    }
}

void SqlBuilder::append_insert_columns(std::string& sql) const
{
    const auto columns = insert_columns();
    if (columns.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "No insertable columns were supplied for " + table_->name().to_string());
    }
    append_column_list(sql, columns);
}

void SqlBuilder::append_insert_values(std::string& sql, ParameterList& parameters) const
{
    append_value_list(sql, insert_columns(), parameters);
}

void SqlBuilder::append_column_list(std::string& sql, const EntryList& columns, std::string_view prefix)
{
    sql.push_back('(');
    bool first = true;
    for (const auto* entry : columns) {
        if (!first) {
            sql.append(", ");
        }
        first = false;
        sql.append(prefix);
        sql.append(entry->column->quoted_sql_name());
    }
    sql.push_back(')');
}

void SqlBuilder::append_value_list(std::string& sql, const EntryList& columns, ParameterList& parameters)
{
    sql.push_back('(');
    bool first = true;
    for (const auto* entry : columns) {
        if (!first) {
            sql.append(", ");
        }
        first = false;
        sql.append(parameters.add(entry->column->property_name(), entry->value));
    }
    sql.push_back(')');
}

void SqlBuilder::append_key_predicate(std::string& sql, ParameterList& parameters) const
{
    bool first = true;
    for (const auto* entry : key_columns()) {
        if (!first) {
            sql.append(" AND ");
        }
        first = false;
        sql.append(entry->column->quoted_sql_name());
        if (entry->value.is_null()) {
            sql.append(" IS NULL");
        } else {
            sql.append(" = ");
            sql.append(parameters.add(entry->column->property_name(), entry->value));
        }
    }
}

void SqlBuilder::append_filter(std::string& sql, const Filter& filter, ParameterList& parameters) const
{
    if (const auto* structured = std::get_if<StructuredFilter>(&filter)) {
        append_structured_filter(sql, *structured, parameters);
    } else if (const auto* raw = std::get_if<RawFilter>(&filter)) {
        append_raw_filter(sql, *raw, parameters);
    }
}

void SqlBuilder::append_structured_filter(std::string& sql,
                                          const StructuredFilter& filter,
                                          ParameterList& parameters) const
{
    std::string predicate;
    std::vector<std::string> missing;
    bool matched = false;
    for (const auto& supplied : filter.value.entries()) {
        const auto* column = table_->try_get_column(supplied.name);
        if (column == nullptr) {
            missing.push_back(supplied.name);
            continue;
        }
        matched = true;
        if (supplied.value.is_null() && filter.options == FilterOptions::IgnoreNullProperties) {
            continue;
        }
        if (!predicate.empty()) {
            predicate.append(" AND ");
        }
        predicate.append(column->quoted_sql_name());
        if (supplied.value.is_null()) {
            predicate.append(" IS NULL");
        } else {
            predicate.append(" = ");
            predicate.append(parameters.add(column->property_name(), supplied.value));
        }
    }

    if (strict_mode_ && !missing.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "The table " + table_->name().to_string()
                                    + " is missing a column mapped to the filter values: " + join_names(missing));
    }
    if (!matched) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "Unable to find any properties on " + filter.value.describe()
                                    + " that match the columns on " + table_->name().to_string());
    }
    if (!predicate.empty()) {
        sql.append(" WHERE ");
        sql.append(predicate);
    }
}

void SqlBuilder::append_raw_filter(std::string& sql, const RawFilter& filter, ParameterList& parameters) const
{
    bind_raw_arguments(filter.where_clause, filter.arguments, filter.parameters, strict_mode_, parameters);
    sql.append(" WHERE ");
    sql.append(filter.where_clause);
}

void bind_raw_arguments(std::string_view text,
                        const model::ArgumentValue& arguments,
                        std::span<const execution::SqlParameter> explicit_parameters,
                        bool strict_mode,
                        ParameterList& parameters)
{
    for (const auto& supplied : arguments.entries()) {
        parameters.add_exact(execution::SqlParameter{parameter_marker(supplied.name), supplied.value, std::nullopt});
    }
    for (const auto& parameter : explicit_parameters) {
        parameters.add_exact(parameter);
    }

    if (!strict_mode) {
        return;
    }

    auto scan = parser::scan_parameter_markers(text);
    if (!scan.success()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "Unable to read parameter markers: " + scan.diagnostics.front().message);
    }
    std::vector<std::string> unbound;
    for (const auto& name : scan.ast->named) {
        if (!parameters.contains(parameter_marker(name))) {
            unbound.push_back(parameter_marker(name));
        }
    }
    if (!unbound.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "No value was supplied for the parameter(s): " + join_names(unbound));
    }
}

}  // namespace sqlchain::builder
