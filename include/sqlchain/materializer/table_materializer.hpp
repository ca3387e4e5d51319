#pragma once

#include "sqlchain/builder/operation_command.hpp"
#include "sqlchain/core/value.hpp"
#include "sqlchain/materializer/materializer.hpp"

#include <future>
#include <stop_token>
#include <vector>

namespace sqlchain::materializer {

// Every column of every row as name/value pairs, in result order.
class TableMaterializer final : public Materializer {
public:
    explicit TableMaterializer(builder::OperationCommand command);

    [[nodiscard]] DesiredColumns desired_columns() const override { return DesiredColumns::all(); }

    [[nodiscard]] std::vector<core::ValueMap> execute() const;
    [[nodiscard]] std::future<std::vector<core::ValueMap>> execute_async(std::stop_token stop = {}) const;

private:
    builder::OperationCommand command_;
};

}  // namespace sqlchain::materializer
