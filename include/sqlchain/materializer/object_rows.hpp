#pragma once

#include "sqlchain/execution/data_source.hpp"
#include "sqlchain/execution/execution_token.hpp"
#include "sqlchain/materializer/compiled_binder.hpp"
#include "sqlchain/materializer/row_binder.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sqlchain::materializer::detail {

// Text of the chain's reading statement; compiled binders are keyed by it.
[[nodiscard]] std::string reading_command_text(const execution::ExecutionToken& token);

// Binds every row of `cursor` into a fresh T and hands it to `sink`, which
// returns false once it wants no more objects. Remaining rows are still
// counted. Returns the number of rows read.
template <model::MappedType T, typename Sink>
std::int64_t read_objects(execution::RowCursor& cursor,
                          execution::DataSource& source,
                          const std::string& command_text,
                          bool compiled,
                          Sink&& sink)
{
    const auto& type = model::type_descriptor<T>();
    std::shared_ptr<const CompiledBinder> binder;
    bool wanted = true;
    std::int64_t count = 0;
    while (cursor.read()) {
        ++count;
        if (!wanted) {
            continue;
        }
        T object{};
        if (compiled) {
            if (!binder) {
                binder = source.binder_cache().get_or_compile(command_text, cursor, type);
            }
            binder->bind(cursor, &object);
        } else {
            bind_row(cursor, type, &object);
        }
        wanted = sink(std::move(object));
    }
    if (auto* telemetry = source.telemetry(); telemetry != nullptr) {
        telemetry->record_rows_materialized(static_cast<std::uint64_t>(count));
    }
    return count;
}

}  // namespace sqlchain::materializer::detail
