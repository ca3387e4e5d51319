#pragma once

#include "sqlchain/builder/operation_command.hpp"
#include "sqlchain/materializer/materializer.hpp"

#include <cstdint>
#include <future>
#include <optional>
#include <stop_token>

namespace sqlchain::materializer {

// Runs a write without reading anything back and reports the affected rows.
class RowCountMaterializer final : public Materializer {
public:
    explicit RowCountMaterializer(builder::OperationCommand command);

    [[nodiscard]] DesiredColumns desired_columns() const override { return DesiredColumns::none(); }

    // nullopt when the driver does not report a count.
    [[nodiscard]] std::optional<std::int64_t> execute() const;
    [[nodiscard]] std::future<std::optional<std::int64_t>> execute_async(std::stop_token stop = {}) const;

private:
    builder::OperationCommand command_;
};

}  // namespace sqlchain::materializer
