#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sqlchain::core {

using Blob = std::vector<std::byte>;

enum class ValueKind : std::uint8_t {
    Null = 0,
    Boolean,
    Int32,
    Int64,
    Double,
    String,
    Binary
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

class Value final {
public:
    using Storage = std::variant<std::monostate, bool, std::int32_t, std::int64_t, double, std::string, Blob>;

    Value() = default;
    Value(std::nullopt_t) noexcept {}
    Value(bool value) : storage_{value} {}
    Value(std::int32_t value) : storage_{value} {}
    Value(std::int64_t value) : storage_{value} {}
    Value(double value) : storage_{value} {}
    Value(std::string value) : storage_{std::move(value)} {}
    Value(std::string_view value) : storage_{std::string{value}} {}
    Value(const char* value) : storage_{std::string{value}} {}
    Value(Blob value) : storage_{std::move(value)} {}

    template <typename T>
    Value(const std::optional<T>& value)
    {
        if (value) {
            *this = Value{*value};
        }
    }

    [[nodiscard]] ValueKind kind() const noexcept;
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(storage_); }

    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int32_t as_int32() const;
    [[nodiscard]] std::int64_t as_int64() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Blob& as_blob() const;

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    friend bool operator==(const Value&, const Value&) = default;

private:
    Storage storage_{};
};

// Ordered name/value pairs; insertion order is the column order.
using ValueMap = std::vector<std::pair<std::string, Value>>;

[[nodiscard]] const Value* find_value(const ValueMap& values, std::string_view name) noexcept;

// Widening and narrowing between the numeric kinds; NULL converts to NULL.
// Anything else raises ChainErrc::ConversionFailed.
[[nodiscard]] Value convert_value(const Value& value, ValueKind target);

[[nodiscard]] std::string to_display_string(const Value& value);

}  // namespace sqlchain::core
