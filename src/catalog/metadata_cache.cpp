#include "sqlchain/catalog/metadata_cache.hpp"

#include "sqlchain/builder/sql_dialect.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/identifier.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::catalog {

MetadataCache::MetadataCache(const builder::SqlDialect& dialect, Config config)
    : dialect_{&dialect}
    , config_{std::move(config)}
{
    if (!config_.session) {
        throw std::invalid_argument{"MetadataCache requires a native session"};
    }
}

MetadataCache::TablePtr MetadataCache::get_table_or_view(const ObjectName& name)
{
    if (name.empty()) {
        throw std::invalid_argument{"MetadataCache requires a table or view name"};
    }

    const auto normalized = dialect_->normalize_name(name);
    return tables_.get_or_create(normalized, [this](const ObjectName& key) {
        core::ChainTelemetry::LatencyScope latency{config_.telemetry, core::ChainTelemetry::Stage::Discovery};
        auto table = discover_table_or_view(key);
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_metadata_discovery(table != nullptr);
        }
        if (!table && !reports_absence()) {
            core::throw_chain_error(core::ChainErrc::MetadataNotFound,
                                    "Could not find table or view " + key.to_string() + " using the "
                                        + std::string{dialect_->name()} + " dialect");
        }
        return table;
    });
}

MetadataCache::TablePtr MetadataCache::get_table_or_view(std::string_view name)
{
    return get_table_or_view(parse_object_name(name));
}

MetadataCache::ProcedurePtr MetadataCache::get_stored_procedure(const ObjectName& name)
{
    if (name.empty()) {
        throw std::invalid_argument{"MetadataCache requires a procedure name"};
    }

    const auto normalized = dialect_->normalize_name(name);
    return procedures_.get_or_create(normalized, [this](const ObjectName& key) {
        core::ChainTelemetry::LatencyScope latency{config_.telemetry, core::ChainTelemetry::Stage::Discovery};
        auto procedure = discover_stored_procedure(key);
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_metadata_discovery(procedure != nullptr);
        }
        return procedure;
    });
}

void MetadataCache::preload_tables()
{
    for (const auto& name : list_objects(true)) {
        (void)get_table_or_view(name);
    }
}

void MetadataCache::preload_views()
{
    for (const auto& name : list_objects(false)) {
        (void)get_table_or_view(name);
    }
}

std::vector<MetadataCache::TablePtr> MetadataCache::cached_tables_and_views() const
{
    std::vector<TablePtr> result;
    for (auto& table : tables_.completed_values()) {
        if (table) {
            result.push_back(std::move(table));
        }
    }
    return result;
}

std::uint64_t MetadataCache::discovery_count() const noexcept
{
    return tables_.stats().misses;
}

MetadataCache::ProcedurePtr MetadataCache::discover_stored_procedure(const ObjectName&)
{
    return nullptr;
}

std::vector<core::ValueMap> MetadataCache::query(std::string_view text,
                                                 std::vector<execution::SqlParameter> parameters) const
{
    execution::CommandRequest request{};
    request.text = std::string{text};
    request.timeout = config_.command_timeout;
    request.parameters = std::move(parameters);

    auto command = config_.session->create_command();
    auto cursor = command->execute_reader(request);

    std::vector<core::ValueMap> rows;
    const auto field_count = cursor->field_count();
    while (cursor->read()) {
        core::ValueMap row;
        row.reserve(field_count);
        for (std::size_t index = 0U; index < field_count; ++index) {
            row.emplace_back(std::string{cursor->name(index)}, cursor->get_value(index));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<ColumnDefinition> MetadataCache::column_definitions(const std::vector<core::ValueMap>& rows) const
{
    std::vector<ColumnDefinition> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        ColumnDefinition column{};
        column.name = text_of(row, "ColumnName");
        column.type_name = text_of(row, "TypeName");
        column.value_kind = dialect_->value_kind_for(column.type_name);
        column.is_nullable = flag_of(row, "IsNullable");
        column.is_identity = flag_of(row, "IsIdentity");
        column.is_computed = flag_of(row, "IsComputed");
        column.is_primary_key = flag_of(row, "IsPrimaryKey");
        columns.push_back(std::move(column));
    }
    return columns;
}

MetadataCache::TablePtr MetadataCache::make_table(ObjectName name,
                                                  bool is_table,
                                                  std::vector<ColumnDefinition> columns) const
{
    std::vector<ColumnMetadata> metadata;
    metadata.reserve(columns.size());
    for (auto& definition : columns) {
        auto quoted = dialect_->quote_identifier(definition.name);
        metadata.emplace_back(std::move(definition), std::move(quoted));
    }
    auto quoted_name = dialect_->quote_name(name);
    return std::make_shared<const TableOrViewMetadata>(std::move(name), std::move(quoted_name), is_table,
                                                       std::move(metadata));
}

MetadataCache::ProcedurePtr MetadataCache::make_procedure(ObjectName name,
                                                          std::vector<ParameterMetadata> parameters) const
{
    auto quoted_name = dialect_->quote_name(name);
    return std::make_shared<const StoredProcedureMetadata>(std::move(name), std::move(quoted_name),
                                                           std::move(parameters));
}

std::string MetadataCache::text_of(const core::ValueMap& row, std::string_view column)
{
    const auto* value = core::find_value(row, column);
    if (value == nullptr || value->is_null()) {
        return {};
    }
    if (value->kind() == core::ValueKind::String) {
        return value->as_string();
    }
    return core::to_display_string(*value);
}

std::int64_t MetadataCache::integer_of(const core::ValueMap& row, std::string_view column)
{
    const auto* value = core::find_value(row, column);
    if (value == nullptr || value->is_null()) {
        return 0;
    }
    if (value->kind() == core::ValueKind::String) {
        return std::stoll(value->as_string());
    }
    return core::convert_value(*value, core::ValueKind::Int64).as_int64();
}

bool MetadataCache::flag_of(const core::ValueMap& row, std::string_view column)
{
    const auto* value = core::find_value(row, column);
    if (value == nullptr || value->is_null()) {
        return false;
    }
    if (value->kind() == core::ValueKind::String) {
        const auto& text = value->as_string();
        return text == "1" || core::iequals(text, "true") || core::iequals(text, "yes");
    }
    return core::convert_value(*value, core::ValueKind::Boolean).as_bool();
}

}  // namespace sqlchain::catalog
