#pragma once

#include "sqlchain/catalog/object_name.hpp"
#include "sqlchain/execution/native_command.hpp"
#include "sqlchain/model/argument_value.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqlchain::builder {

enum class OperationKind : std::uint8_t {
    Query = 0,
    Insert,
    Update,
    UpdateSet,
    Upsert,
    Delete,
    DeleteSet
};

[[nodiscard]] std::string_view to_string(OperationKind kind) noexcept;
[[nodiscard]] constexpr bool is_mutation(OperationKind kind) noexcept
{
    return kind != OperationKind::Query;
}

enum class SortDirection : std::uint8_t {
    Ascending = 0,
    Descending
};

struct SortExpression final {
    std::string column{};
    SortDirection direction = SortDirection::Ascending;
};

enum class LimitStrategy : std::uint8_t {
    None = 0,
    Offset,
    Top,
    RandomSample
};

struct Paging final {
    std::optional<std::int64_t> skip{};
    std::optional<std::int64_t> take{};
    LimitStrategy strategy = LimitStrategy::None;
    std::optional<std::int64_t> seed{};
};

enum class FilterOptions : std::uint8_t {
    None = 0,
    IgnoreNullProperties
};

struct StructuredFilter final {
    model::ArgumentValue value{};
    FilterOptions options = FilterOptions::None;
};

struct RawFilter final {
    std::string where_clause{};
    model::ArgumentValue arguments{};
    std::vector<execution::SqlParameter> parameters{};
};

using Filter = std::variant<std::monostate, StructuredFilter, RawFilter>;

struct RawExpression final {
    std::string text{};
    model::ArgumentValue arguments{};
};

enum class WriteOptions : std::uint32_t {
    None = 0U,
    UseKeyAttribute = 1U << 0U,
    ReturnOldValues = 1U << 1U,
    IgnoreRowsAffected = 1U << 2U
};

[[nodiscard]] constexpr WriteOptions operator|(WriteOptions lhs, WriteOptions rhs) noexcept
{
    return static_cast<WriteOptions>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr bool has_flag(WriteOptions value, WriteOptions flag) noexcept
{
    return (static_cast<std::uint32_t>(value) & static_cast<std::uint32_t>(flag)) != 0U;
}

// Immutable description of one operation against one table or view. Every
// with_* call returns a new descriptor; the receiver is never modified.
class OperationDescriptor final {
public:
    [[nodiscard]] static OperationDescriptor query(catalog::ObjectName target);
    [[nodiscard]] static OperationDescriptor insert(catalog::ObjectName target, model::ArgumentValue values);
    [[nodiscard]] static OperationDescriptor update(catalog::ObjectName target,
                                                    model::ArgumentValue values,
                                                    WriteOptions options = WriteOptions::None);
    [[nodiscard]] static OperationDescriptor update_set(catalog::ObjectName target, model::ArgumentValue values);
    [[nodiscard]] static OperationDescriptor update_set(catalog::ObjectName target, RawExpression expression);
    [[nodiscard]] static OperationDescriptor upsert(catalog::ObjectName target,
                                                    model::ArgumentValue values,
                                                    WriteOptions options = WriteOptions::None);
    [[nodiscard]] static OperationDescriptor remove(catalog::ObjectName target,
                                                    model::ArgumentValue key_values,
                                                    WriteOptions options = WriteOptions::None);
    [[nodiscard]] static OperationDescriptor delete_set(catalog::ObjectName target);

    // Each filter form replaces whichever filter was set before.
    [[nodiscard]] OperationDescriptor with_filter(model::ArgumentValue filter,
                                                  FilterOptions options = FilterOptions::None) const;
    [[nodiscard]] OperationDescriptor with_where(std::string where_clause,
                                                 model::ArgumentValue arguments = {}) const;
    [[nodiscard]] OperationDescriptor with_where(std::string where_clause,
                                                 std::vector<execution::SqlParameter> parameters) const;
    [[nodiscard]] OperationDescriptor with_sorting(std::vector<SortExpression> sort) const;
    [[nodiscard]] OperationDescriptor with_limits(std::optional<std::int64_t> skip,
                                                  std::optional<std::int64_t> take,
                                                  LimitStrategy strategy = LimitStrategy::Offset,
                                                  std::optional<std::int64_t> seed = std::nullopt) const;
    [[nodiscard]] OperationDescriptor with_expected_row_count(std::int64_t rows) const;
    [[nodiscard]] OperationDescriptor with_match_columns(std::vector<std::string> columns) const;
    [[nodiscard]] OperationDescriptor with_options(WriteOptions options) const;

    [[nodiscard]] OperationKind kind() const noexcept;
    [[nodiscard]] const catalog::ObjectName& target() const noexcept;
    [[nodiscard]] const model::ArgumentValue& values() const noexcept;
    [[nodiscard]] const std::optional<RawExpression>& update_expression() const noexcept;
    [[nodiscard]] const Filter& filter() const noexcept;
    [[nodiscard]] bool has_filter() const noexcept;
    [[nodiscard]] std::span<const SortExpression> sort() const noexcept;
    [[nodiscard]] const Paging& paging() const noexcept;
    [[nodiscard]] WriteOptions options() const noexcept;
    [[nodiscard]] std::optional<std::int64_t> expected_row_count() const noexcept;
    [[nodiscard]] std::span<const std::string> match_columns() const noexcept;

private:
    struct State final {
        OperationKind kind = OperationKind::Query;
        catalog::ObjectName target{};
        model::ArgumentValue values{};
        std::optional<RawExpression> update_expression{};
        Filter filter{};
        std::vector<SortExpression> sort{};
        Paging paging{};
        WriteOptions options = WriteOptions::None;
        std::optional<std::int64_t> expected_row_count{};
        std::vector<std::string> match_columns{};
    };

    explicit OperationDescriptor(State state);

    [[nodiscard]] OperationDescriptor derive(const std::function<void(State&)>& change) const;

    std::shared_ptr<const State> state_;
};

}  // namespace sqlchain::builder
