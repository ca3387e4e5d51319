#pragma once

#include "sqlchain/builder/operation_descriptor.hpp"
#include "sqlchain/builder/sql_builder.hpp"
#include "sqlchain/catalog/object_name.hpp"
#include "sqlchain/core/value.hpp"
#include "sqlchain/execution/execution_token.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sqlchain::builder {

// How a dialect returns rows touched by a write.
enum class OutputStyle : std::uint8_t {
    Inline = 0,  // OUTPUT Inserted.* / Deleted.* inside the statement
    Returning,   // trailing RETURNING clause, new values only
    None         // no output clause; reads are chained before or after the write
};

// SQL generation rules for one database family. The base class assembles
// every statement shape; subclasses supply quoting, paging and upsert syntax.
class SqlDialect {
public:
    virtual ~SqlDialect() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::string quote_identifier(std::string_view identifier) const = 0;
    [[nodiscard]] std::string quote_name(const catalog::ObjectName& name) const;

    // Fills in the default schema, if the dialect has one.
    [[nodiscard]] virtual catalog::ObjectName normalize_name(const catalog::ObjectName& name) const;

    [[nodiscard]] virtual core::ValueKind value_kind_for(std::string_view type_name) const = 0;
    [[nodiscard]] virtual execution::LockMode lock_mode_for(OperationKind kind) const noexcept;
    [[nodiscard]] virtual OutputStyle output_style() const noexcept = 0;

    [[nodiscard]] execution::ExecutionToken prepare(const StatementContext& context) const;

protected:
    [[nodiscard]] virtual execution::ExecutionToken prepare_query(const StatementContext& context) const;
    [[nodiscard]] virtual execution::ExecutionToken prepare_insert(const StatementContext& context) const;
    [[nodiscard]] virtual execution::ExecutionToken prepare_update(const StatementContext& context) const;
    [[nodiscard]] virtual execution::ExecutionToken prepare_update_set(const StatementContext& context) const;
    [[nodiscard]] virtual execution::ExecutionToken prepare_upsert(const StatementContext& context) const = 0;
    [[nodiscard]] virtual execution::ExecutionToken prepare_delete(const StatementContext& context) const;
    [[nodiscard]] virtual execution::ExecutionToken prepare_delete_set(const StatementContext& context) const;

    virtual void validate_paging(const StatementContext& context) const;
    // Emitted right after "SELECT ".
    virtual void append_top(std::string& sql, const StatementContext& context, ParameterList& parameters) const;
    // Emitted right after the table name.
    virtual void append_table_sample(std::string& sql,
                                     const StatementContext& context,
                                     ParameterList& parameters) const;
    virtual void append_random_order(std::string& sql,
                                     const StatementContext& context,
                                     ParameterList& parameters) const = 0;
    virtual void append_limits(std::string& sql, const StatementContext& context, ParameterList& parameters) const;
    // LIMIT clause used when only a skip is given; empty when OFFSET may stand alone.
    [[nodiscard]] virtual std::string_view unbounded_limit() const noexcept { return {}; }

    [[nodiscard]] SqlBuilder make_builder(const StatementContext& context) const;
    [[nodiscard]] KeySource key_source_for(const StatementContext& context) const noexcept;
    [[nodiscard]] static std::string operation_name(const StatementContext& context);

    [[nodiscard]] execution::ExecutionToken make_token(const StatementContext& context,
                                                       std::string sql,
                                                       ParameterList parameters,
                                                       bool reads_rows,
                                                       std::optional<std::int64_t> expected_row_count) const;

    // SELECT of the read columns restricted by `predicate`, which starts with " WHERE".
    [[nodiscard]] execution::ExecutionToken make_read_token(const StatementContext& context,
                                                            const SqlBuilder& builder,
                                                            const std::string& predicate,
                                                            ParameterList parameters) const;

    // Which version of the touched rows a write reports.
    enum class RowImage : std::uint8_t {
        New = 0,
        Old,
        Deleted
    };

    // Assembles `head` + `tail` with whatever output clause or chained read
    // this dialect needs. `read_predicate` builds the WHERE clause of a
    // chained read against a fresh parameter list.
    [[nodiscard]] execution::ExecutionToken finish_write(
        const StatementContext& context,
        const SqlBuilder& builder,
        std::string head,
        const std::string& tail,
        ParameterList parameters,
        RowImage image,
        const std::function<std::string(ParameterList&)>& read_predicate) const;

    [[nodiscard]] static execution::ExecutionToken chain(execution::ExecutionToken write,
                                                         execution::ExecutionToken read,
                                                         bool read_first);

    // Where-clause of a set-based operation; the filter is mandatory.
    [[nodiscard]] static std::string set_predicate(const StatementContext& context,
                                                   const SqlBuilder& builder,
                                                   ParameterList& parameters);

    // Row read back after an insert on dialects without output clauses.
    [[nodiscard]] virtual std::string inserted_row_predicate(const SqlBuilder& builder,
                                                             ParameterList& parameters) const;

    // INSERT ... ON CONFLICT (keys) DO UPDATE SET a = <excluded>.a
    [[nodiscard]] execution::ExecutionToken prepare_on_conflict_upsert(const StatementContext& context,
                                                                       std::string_view excluded) const;

    static void append_sort(std::string& sql, const StatementContext& context);
};

[[nodiscard]] std::string quote_with(std::string_view identifier, char open, char close);

}  // namespace sqlchain::builder
