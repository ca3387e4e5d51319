#include "sqlchain/core/value.hpp"

#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/identifier.hpp"

#include <cmath>
#include <limits>

namespace sqlchain::core {

namespace {

[[noreturn]] void throw_kind_mismatch(ValueKind actual, ValueKind requested)
{
    throw_chain_error(ChainErrc::ConversionFailed,
                      "Value of kind " + std::string{to_string(actual)} + " cannot be read as "
                          + std::string{to_string(requested)});
}

template <typename Integer>
[[nodiscard]] Integer narrow_integer(std::int64_t value, ValueKind target)
{
    if (value < static_cast<std::int64_t>(std::numeric_limits<Integer>::min())
        || value > static_cast<std::int64_t>(std::numeric_limits<Integer>::max())) {
        throw_chain_error(ChainErrc::ConversionFailed,
                          "Value " + std::to_string(value) + " is out of range for " + std::string{to_string(target)});
    }
    return static_cast<Integer>(value);
}

[[nodiscard]] std::int64_t integral_from_double(double value, ValueKind target)
{
    if (!std::isfinite(value) || value < -9.2233720368547758e18 || value >= 9.2233720368547758e18) {
        throw_chain_error(ChainErrc::ConversionFailed, "Value is out of range for " + std::string{to_string(target)});
    }
    return static_cast<std::int64_t>(value);
}

[[nodiscard]] std::int64_t as_integral(const Value& value, ValueKind target)
{
    switch (value.kind()) {
    case ValueKind::Boolean:
        return value.as_bool() ? 1 : 0;
    case ValueKind::Int32:
        return value.as_int32();
    case ValueKind::Int64:
        return value.as_int64();
    case ValueKind::Double:
        return integral_from_double(value.as_double(), target);
    default:
        throw_kind_mismatch(value.kind(), target);
    }
}

}  // namespace

std::string_view to_string(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Int32:
        return "int32";
    case ValueKind::Int64:
        return "int64";
    case ValueKind::Double:
        return "double";
    case ValueKind::String:
        return "string";
    case ValueKind::Binary:
        return "binary";
    default:
        return "unknown";
    }
}

ValueKind Value::kind() const noexcept
{
    return static_cast<ValueKind>(storage_.index());
}

bool Value::as_bool() const
{
    if (const auto* value = std::get_if<bool>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch(kind(), ValueKind::Boolean);
}

std::int32_t Value::as_int32() const
{
    if (const auto* value = std::get_if<std::int32_t>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch(kind(), ValueKind::Int32);
}

std::int64_t Value::as_int64() const
{
    if (const auto* value = std::get_if<std::int64_t>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch(kind(), ValueKind::Int64);
}

double Value::as_double() const
{
    if (const auto* value = std::get_if<double>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch(kind(), ValueKind::Double);
}

const std::string& Value::as_string() const
{
    if (const auto* value = std::get_if<std::string>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch(kind(), ValueKind::String);
}

const Blob& Value::as_blob() const
{
    if (const auto* value = std::get_if<Blob>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch(kind(), ValueKind::Binary);
}

const Value* find_value(const ValueMap& values, std::string_view name) noexcept
{
    for (const auto& [key, value] : values) {
        if (iequals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

Value convert_value(const Value& value, ValueKind target)
{
    if (value.is_null() || value.kind() == target || target == ValueKind::Null) {
        return value;
    }

    switch (target) {
    case ValueKind::Boolean:
        return Value{as_integral(value, target) != 0};
    case ValueKind::Int32:
        return Value{narrow_integer<std::int32_t>(as_integral(value, target), target)};
    case ValueKind::Int64:
        return Value{as_integral(value, target)};
    case ValueKind::Double:
        return Value{static_cast<double>(as_integral(value, target))};
    case ValueKind::String:
    case ValueKind::Binary:
    default:
        throw_kind_mismatch(value.kind(), target);
    }
}

std::string to_display_string(const Value& value)
{
    switch (value.kind()) {
    case ValueKind::Null:
        return "NULL";
    case ValueKind::Boolean:
        return value.as_bool() ? "true" : "false";
    case ValueKind::Int32:
        return std::to_string(value.as_int32());
    case ValueKind::Int64:
        return std::to_string(value.as_int64());
    case ValueKind::Double:
        return std::to_string(value.as_double());
    case ValueKind::String:
        return value.as_string();
    case ValueKind::Binary:
        return "<" + std::to_string(value.as_blob().size()) + " bytes>";
    default:
        return {};
    }
}

}  // namespace sqlchain::core
