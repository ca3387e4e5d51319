#pragma once

#include "sqlchain/builder/operation_command.hpp"
#include "sqlchain/materializer/materializer.hpp"
#include "sqlchain/materializer/object_rows.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace sqlchain::materializer {

// Every returned row as a T.
template <model::MappedType T>
class CollectionMaterializer final : public Materializer {
public:
    struct Options final {
        // Bind through a cached CompiledBinder instead of resolving per row.
        bool compiled = false;
    };

    explicit CollectionMaterializer(builder::OperationCommand command, Options options = {})
        : command_{std::move(command)}
        , options_{options}
    {}

    [[nodiscard]] DesiredColumns desired_columns() const override
    {
        return DesiredColumns::of(model::type_descriptor<T>().columns_for());
    }

    [[nodiscard]] std::vector<T> execute() const
    {
        auto token = command_.prepare(*this);
        auto& source = command_.data_source();
        const auto text = detail::reading_command_text(token);

        std::vector<T> rows;
        (void)source.execute(token, [&](execution::RowCursor& cursor) -> std::optional<std::int64_t> {
            return detail::read_objects<T>(cursor, source, text, options_.compiled, [&rows](T&& row) {
                rows.push_back(std::move(row));
                return true;
            });
        });
        return rows;
    }

    [[nodiscard]] std::future<std::vector<T>> execute_async(std::stop_token stop = {}) const
    {
        auto token = command_.prepare(*this);
        auto* source = &command_.data_source();
        auto text = detail::reading_command_text(token);
        auto rows = std::make_shared<std::vector<T>>();
        const bool compiled = options_.compiled;

        auto done = source->execute_async(
            std::move(token),
            [source, text = std::move(text), rows, compiled](execution::RowCursor& cursor)
                -> std::optional<std::int64_t> {
                return detail::read_objects<T>(cursor, *source, text, compiled, [&rows](T&& row) {
                    rows->push_back(std::move(row));
                    return true;
                });
            },
            std::move(stop));

        return std::async(std::launch::deferred, [done = std::move(done), rows]() mutable {
            (void)done.get();
            return std::move(*rows);
        });
    }

private:
    builder::OperationCommand command_;
    Options options_;
};

}  // namespace sqlchain::materializer
