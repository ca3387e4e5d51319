#pragma once

#include "sqlchain/builder/operation_command.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/materializer/materializer.hpp"
#include "sqlchain/materializer/object_rows.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

namespace sqlchain::materializer {

enum class RowOptions : std::uint8_t {
    None = 0U,
    AllowEmptyResults = 1U << 0U,
    DiscardExtraRows = 1U << 1U
};

[[nodiscard]] constexpr RowOptions operator|(RowOptions lhs, RowOptions rhs) noexcept
{
    return static_cast<RowOptions>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr bool has_flag(RowOptions value, RowOptions flag) noexcept
{
    return (static_cast<std::uint8_t>(value) & static_cast<std::uint8_t>(flag)) != 0U;
}

// Exactly one row as a T. No rows raises ChainErrc::MissingData and more than
// one raises ChainErrc::UnexpectedData unless the row options allow it.
template <model::MappedType T>
class ObjectMaterializer final : public Materializer {
public:
    struct Options final {
        RowOptions rows = RowOptions::None;
        bool compiled = false;
    };

    explicit ObjectMaterializer(builder::OperationCommand command, Options options = {})
        : command_{std::move(command)}
        , options_{options}
    {}

    [[nodiscard]] DesiredColumns desired_columns() const override
    {
        return DesiredColumns::of(model::type_descriptor<T>().columns_for());
    }

    // nullopt only with RowOptions::AllowEmptyResults.
    [[nodiscard]] std::optional<T> execute() const
    {
        auto token = command_.prepare(*this);
        auto& source = command_.data_source();
        const auto text = detail::reading_command_text(token);

        Result result;
        (void)source.execute(token, [&](execution::RowCursor& cursor) -> std::optional<std::int64_t> {
            return collect(cursor, source, text, options_.compiled, result);
        });
        return finish(std::move(result));
    }

    [[nodiscard]] std::future<std::optional<T>> execute_async(std::stop_token stop = {}) const
    {
        auto token = command_.prepare(*this);
        auto* source = &command_.data_source();
        auto text = detail::reading_command_text(token);
        auto result = std::make_shared<Result>();
        const bool compiled = options_.compiled;

        auto done = source->execute_async(
            std::move(token),
            [source, text = std::move(text), result, compiled](execution::RowCursor& cursor)
                -> std::optional<std::int64_t> { return collect(cursor, *source, text, compiled, *result); },
            std::move(stop));

        return std::async(std::launch::deferred, [self = *this, done = std::move(done), result]() mutable {
            (void)done.get();
            return self.finish(std::move(*result));
        });
    }

private:
    struct Result final {
        std::optional<T> first{};
        std::int64_t rows = 0;
    };

    static std::int64_t collect(execution::RowCursor& cursor,
                                execution::DataSource& source,
                                const std::string& text,
                                bool compiled,
                                Result& result)
    {
        const auto rows = detail::read_objects<T>(cursor, source, text, compiled, [&result](T&& row) {
            result.first = std::move(row);
            return false;
        });
        result.rows += rows;
        return rows;
    }

    [[nodiscard]] std::optional<T> finish(Result result) const
    {
        const auto& operation = command_.descriptor();
        const auto target = operation.target().to_string();
        if (result.rows == 0) {
            if (has_flag(options_.rows, RowOptions::AllowEmptyResults)) {
                return std::nullopt;
            }
            core::throw_chain_error(core::ChainErrc::MissingData,
                                    "No rows were returned by " + std::string{builder::to_string(operation.kind())}
                                        + " " + target);
        }
        if (result.rows > 1 && !has_flag(options_.rows, RowOptions::DiscardExtraRows)) {
            core::throw_chain_error(core::ChainErrc::UnexpectedData,
                                    "Expected one row from " + std::string{builder::to_string(operation.kind())}
                                        + " " + target + " but " + std::to_string(result.rows)
                                        + " were returned");
        }
        return std::move(result.first);
    }

    builder::OperationCommand command_;
    Options options_;
};

}  // namespace sqlchain::materializer
