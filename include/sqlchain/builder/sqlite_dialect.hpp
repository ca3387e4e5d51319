#pragma once

#include "sqlchain/builder/sql_dialect.hpp"

namespace sqlchain::builder {

// SQLite allows one writer at a time, so reads take a shared lock and every
// write an exclusive one.
class SqliteDialect final : public SqlDialect {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "SQLite"; }
    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override;
    [[nodiscard]] core::ValueKind value_kind_for(std::string_view type_name) const override;
    [[nodiscard]] execution::LockMode lock_mode_for(OperationKind kind) const noexcept override;
    [[nodiscard]] OutputStyle output_style() const noexcept override { return OutputStyle::Returning; }

protected:
    [[nodiscard]] execution::ExecutionToken prepare_upsert(const StatementContext& context) const override;

    void append_random_order(std::string& sql,
                             const StatementContext& context,
                             ParameterList& parameters) const override;
    [[nodiscard]] std::string_view unbounded_limit() const noexcept override { return " LIMIT -1"; }
};

}  // namespace sqlchain::builder
