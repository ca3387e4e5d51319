#pragma once

#include "sqlchain/builder/sql_dialect.hpp"

namespace sqlchain::builder {

// T-SQL: [bracket] quoting, dbo as the default schema, OUTPUT clauses,
// OFFSET/FETCH paging that requires a sort, MERGE for upserts.
class SqlServerDialect final : public SqlDialect {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "SQL Server"; }
    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override;
    [[nodiscard]] catalog::ObjectName normalize_name(const catalog::ObjectName& name) const override;
    [[nodiscard]] core::ValueKind value_kind_for(std::string_view type_name) const override;
    [[nodiscard]] OutputStyle output_style() const noexcept override { return OutputStyle::Inline; }

protected:
    [[nodiscard]] execution::ExecutionToken prepare_upsert(const StatementContext& context) const override;

    void validate_paging(const StatementContext& context) const override;
    void append_top(std::string& sql, const StatementContext& context, ParameterList& parameters) const override;
    void append_table_sample(std::string& sql,
                             const StatementContext& context,
                             ParameterList& parameters) const override;
    void append_random_order(std::string& sql,
                             const StatementContext& context,
                             ParameterList& parameters) const override;
    void append_limits(std::string& sql, const StatementContext& context, ParameterList& parameters) const override;
};

}  // namespace sqlchain::builder
