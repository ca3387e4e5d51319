#pragma once

#include "sqlchain/builder/sql_dialect.hpp"

namespace sqlchain::builder {

// MySQL has no output clause: rows written are read back by a chained SELECT.
class MySqlDialect final : public SqlDialect {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "MySQL"; }
    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override;
    [[nodiscard]] core::ValueKind value_kind_for(std::string_view type_name) const override;
    [[nodiscard]] OutputStyle output_style() const noexcept override { return OutputStyle::None; }

protected:
    [[nodiscard]] execution::ExecutionToken prepare_upsert(const StatementContext& context) const override;

    void append_random_order(std::string& sql,
                             const StatementContext& context,
                             ParameterList& parameters) const override;
    [[nodiscard]] std::string_view unbounded_limit() const noexcept override
    {
        return " LIMIT 18446744073709551615";
    }
    [[nodiscard]] std::string inserted_row_predicate(const SqlBuilder& builder,
                                                     ParameterList& parameters) const override;
};

}  // namespace sqlchain::builder
