#include "sqlchain/materializer/table_materializer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace sqlchain::materializer {

namespace {

std::int64_t read_table(execution::RowCursor& cursor, execution::DataSource& source, std::vector<core::ValueMap>& rows)
{
    const auto field_count = cursor.field_count();
    std::int64_t count = 0;
    while (cursor.read()) {
        core::ValueMap row;
        row.reserve(field_count);
        for (std::size_t index = 0U; index < field_count; ++index) {
            row.emplace_back(std::string{cursor.name(index)},
                             cursor.is_null(index) ? core::Value{} : cursor.get_value(index));
        }
        rows.push_back(std::move(row));
        ++count;
    }
    if (auto* telemetry = source.telemetry(); telemetry != nullptr) {
        telemetry->record_rows_materialized(static_cast<std::uint64_t>(count));
    }
    return count;
}

}  // namespace

TableMaterializer::TableMaterializer(builder::OperationCommand command)
    : command_{std::move(command)}
{
}

std::vector<core::ValueMap> TableMaterializer::execute() const
{
    auto token = command_.prepare(*this);
    auto& source = command_.data_source();

    std::vector<core::ValueMap> rows;
    (void)source.execute(token, [&](execution::RowCursor& cursor) -> std::optional<std::int64_t> {
        return read_table(cursor, source, rows);
    });
    return rows;
}

std::future<std::vector<core::ValueMap>> TableMaterializer::execute_async(std::stop_token stop) const
{
    auto token = command_.prepare(*this);
    auto* source = &command_.data_source();
    auto rows = std::make_shared<std::vector<core::ValueMap>>();

    auto done = source->execute_async(
        std::move(token),
        [source, rows](execution::RowCursor& cursor) -> std::optional<std::int64_t> {
            return read_table(cursor, *source, *rows);
        },
        std::move(stop));

    return std::async(std::launch::deferred, [done = std::move(done), rows]() mutable {
        (void)done.get();
        return std::move(*rows);
    });
}

}  // namespace sqlchain::materializer
