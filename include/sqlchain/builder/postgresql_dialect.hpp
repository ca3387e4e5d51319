#pragma once

#include "sqlchain/builder/sql_dialect.hpp"

namespace sqlchain::builder {

class PostgreSqlDialect final : public SqlDialect {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "PostgreSQL"; }
    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override;
    [[nodiscard]] catalog::ObjectName normalize_name(const catalog::ObjectName& name) const override;
    [[nodiscard]] core::ValueKind value_kind_for(std::string_view type_name) const override;
    [[nodiscard]] OutputStyle output_style() const noexcept override { return OutputStyle::Returning; }

protected:
    [[nodiscard]] execution::ExecutionToken prepare_upsert(const StatementContext& context) const override;

    void append_random_order(std::string& sql,
                             const StatementContext& context,
                             ParameterList& parameters) const override;
};

}  // namespace sqlchain::builder
