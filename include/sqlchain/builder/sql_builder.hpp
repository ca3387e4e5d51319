#pragma once

#include "sqlchain/builder/operation_descriptor.hpp"
#include "sqlchain/catalog/table_metadata.hpp"
#include "sqlchain/core/value.hpp"
#include "sqlchain/execution/native_command.hpp"
#include "sqlchain/materializer/materializer.hpp"
#include "sqlchain/model/argument_value.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlchain::builder {

// Parameters bound by one statement. Generated names never collide: a taken
// name gets a numeric suffix.
class ParameterList final {
public:
    // `name` is given without the marker prefix; returns the marker to embed.
    std::string add(std::string_view name, core::Value value);

    // Adds a caller-named parameter. Re-adding an identical parameter is a
    // no-op; the same name with a different value is rejected.
    void add_exact(execution::SqlParameter parameter);

    [[nodiscard]] bool contains(std::string_view marker) const noexcept;
    [[nodiscard]] std::span<const execution::SqlParameter> items() const noexcept { return parameters_; }
    [[nodiscard]] std::vector<execution::SqlParameter> release() && { return std::move(parameters_); }

private:
    std::vector<execution::SqlParameter> parameters_{};
};

[[nodiscard]] std::string parameter_marker(std::string_view name);

enum class KeySource : std::uint8_t {
    None = 0,
    PrimaryKey,
    KeyAttribute,
    MatchColumns
};

struct StatementContext final {
    const catalog::TableOrViewMetadata& table;
    const OperationDescriptor& descriptor;
    const materializer::DesiredColumns& desired;
    bool strict_mode = false;
};

// Working set of the target's columns for one statement: which are read
// back, which carry a bound value, and which identify the row.
class SqlBuilder final {
public:
    struct Entry final {
        const catalog::ColumnMetadata* column = nullptr;
        bool use_for_read = false;
        bool is_key = false;
        bool has_value = false;
        core::Value value{};
    };

    using EntryList = std::vector<const Entry*>;

    SqlBuilder(const catalog::TableOrViewMetadata& table, bool strict_mode);

    void apply_desired_columns(const materializer::DesiredColumns& desired);
    void apply_argument_value(const model::ArgumentValue& argument,
                              KeySource keys,
                              std::span<const std::string> match_columns = {});

    // Every key column must carry a value and at least one must exist.
    void require_key_values(std::string_view operation) const;

    [[nodiscard]] bool has_read_columns() const noexcept;
    [[nodiscard]] EntryList read_columns() const;
    [[nodiscard]] EntryList key_columns() const;
    [[nodiscard]] EntryList insert_columns() const;
    [[nodiscard]] EntryList update_columns() const;
    [[nodiscard]] EntryList value_columns() const;
    // Insert columns of an upsert: supplied identity keys are kept so the
    // conflict target can match them.
    [[nodiscard]] EntryList upsert_insert_columns() const;
    [[nodiscard]] const Entry* identity_column() const noexcept;

    // "a, b" where each name is preceded by `prefix` ("Inserted." etc.).
    void append_select_list(std::string& sql, std::string_view prefix = {}) const;
    void append_set_clause(std::string& sql, ParameterList& parameters) const;
    void append_insert_columns(std::string& sql) const;
    void append_insert_values(std::string& sql, ParameterList& parameters) const;
    // "(a, b)" with each name preceded by `prefix`.
    static void append_column_list(std::string& sql, const EntryList& columns, std::string_view prefix = {});
    static void append_value_list(std::string& sql, const EntryList& columns, ParameterList& parameters);
    void append_key_predicate(std::string& sql, ParameterList& parameters) const;

    void append_filter(std::string& sql, const Filter& filter, ParameterList& parameters) const;

    [[nodiscard]] const catalog::TableOrViewMetadata& table() const noexcept { return *table_; }

private:
    void append_structured_filter(std::string& sql, const StructuredFilter& filter, ParameterList& parameters) const;
    void append_raw_filter(std::string& sql, const RawFilter& filter, ParameterList& parameters) const;
    [[nodiscard]] Entry* find_entry(const catalog::ColumnMetadata* column) noexcept;

    const catalog::TableOrViewMetadata* table_;
    bool strict_mode_ = false;
    std::vector<Entry> entries_{};
};

// Binds raw-text arguments and validates the markers they reference.
void bind_raw_arguments(std::string_view text,
                        const model::ArgumentValue& arguments,
                        std::span<const execution::SqlParameter> explicit_parameters,
                        bool strict_mode,
                        ParameterList& parameters);

}  // namespace sqlchain::builder
