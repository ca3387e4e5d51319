#pragma once

#include "sqlchain/catalog/object_name.hpp"
#include "sqlchain/catalog/procedure_metadata.hpp"
#include "sqlchain/catalog/table_metadata.hpp"
#include "sqlchain/core/chain_telemetry.hpp"
#include "sqlchain/core/lazy_cache.hpp"
#include "sqlchain/core/value.hpp"
#include "sqlchain/execution/native_command.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sqlchain::builder {
class SqlDialect;
}  // namespace sqlchain::builder

namespace sqlchain::catalog {

// Per-data-source catalog of table, view and procedure metadata. Discovery
// runs at most once per name no matter how many threads ask at once.
class MetadataCache {
public:
    using TablePtr = std::shared_ptr<const TableOrViewMetadata>;
    using ProcedurePtr = std::shared_ptr<const StoredProcedureMetadata>;

    struct Config final {
        std::shared_ptr<execution::NativeSession> session{};
        core::ChainTelemetry* telemetry = nullptr;
        std::optional<std::chrono::milliseconds> command_timeout{};
    };

    MetadataCache(const builder::SqlDialect& dialect, Config config);
    virtual ~MetadataCache() = default;

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    // Unknown names raise ChainErrc::MetadataNotFound, except on dialects
    // that report absence, where nullptr is returned and remembered.
    [[nodiscard]] TablePtr get_table_or_view(const ObjectName& name);
    [[nodiscard]] TablePtr get_table_or_view(std::string_view name);

    // nullptr when the dialect has no procedure discovery or the name is unknown.
    [[nodiscard]] ProcedurePtr get_stored_procedure(const ObjectName& name);

    void preload_tables();
    void preload_views();

    [[nodiscard]] std::vector<TablePtr> cached_tables_and_views() const;
    [[nodiscard]] std::uint64_t discovery_count() const noexcept;
    [[nodiscard]] const builder::SqlDialect& dialect() const noexcept { return *dialect_; }
    [[nodiscard]] virtual bool reports_absence() const noexcept { return false; }

protected:
    [[nodiscard]] virtual TablePtr discover_table_or_view(const ObjectName& name) = 0;
    [[nodiscard]] virtual ProcedurePtr discover_stored_procedure(const ObjectName& name);
    [[nodiscard]] virtual std::vector<ObjectName> list_objects(bool tables) = 0;

    [[nodiscard]] std::vector<core::ValueMap> query(std::string_view text,
                                                    std::vector<execution::SqlParameter> parameters = {}) const;
    // Rows carrying ColumnName, TypeName, IsNullable, IsIdentity, IsComputed
    // and IsPrimaryKey.
    [[nodiscard]] std::vector<ColumnDefinition> column_definitions(const std::vector<core::ValueMap>& rows) const;
    [[nodiscard]] TablePtr make_table(ObjectName name, bool is_table, std::vector<ColumnDefinition> columns) const;
    [[nodiscard]] ProcedurePtr make_procedure(ObjectName name, std::vector<ParameterMetadata> parameters) const;

    [[nodiscard]] static std::string text_of(const core::ValueMap& row, std::string_view column);
    [[nodiscard]] static std::int64_t integer_of(const core::ValueMap& row, std::string_view column);
    [[nodiscard]] static bool flag_of(const core::ValueMap& row, std::string_view column);

private:
    const builder::SqlDialect* dialect_;
    Config config_;
    core::LazyCache<ObjectName, TablePtr, ObjectNameHash> tables_{};
    core::LazyCache<ObjectName, ProcedurePtr, ObjectNameHash> procedures_{};
};

}  // namespace sqlchain::catalog
