#include "sqlchain/materializer/row_count_materializer.hpp"

#include <utility>

namespace sqlchain::materializer {

RowCountMaterializer::RowCountMaterializer(builder::OperationCommand command)
    : command_{std::move(command)}
{
}

std::optional<std::int64_t> RowCountMaterializer::execute() const
{
    auto token = command_.prepare(*this);
    return command_.data_source().execute(token, {});
}

std::future<std::optional<std::int64_t>> RowCountMaterializer::execute_async(std::stop_token stop) const
{
    auto token = command_.prepare(*this);
    return command_.data_source().execute_async(std::move(token), {}, std::move(stop));
}

}  // namespace sqlchain::materializer
