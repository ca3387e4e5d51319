#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sqlchain::core {

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
[[nodiscard]] bool istarts_with(std::string_view text, std::string_view prefix) noexcept;
[[nodiscard]] std::string to_lower_copy(std::string_view text);
[[nodiscard]] std::string to_upper_copy(std::string_view text);

// Column names become property-facing names by dropping every character that
// cannot appear in an identifier ("First Name" -> "FirstName").
[[nodiscard]] std::string to_property_name(std::string_view column_name);

struct CaseInsensitiveHash final {
    using is_transparent = void;
    [[nodiscard]] std::size_t operator()(std::string_view text) const noexcept;
};

struct CaseInsensitiveEqual final {
    using is_transparent = void;
    [[nodiscard]] bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return iequals(lhs, rhs);
    }
};

}  // namespace sqlchain::core
