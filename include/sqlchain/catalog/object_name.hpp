#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sqlchain::catalog {

// Schema-qualified database object name. Comparison is case-insensitive.
struct ObjectName final {
    std::string schema{};
    std::string name{};

    [[nodiscard]] bool empty() const noexcept { return name.empty(); }
    [[nodiscard]] bool has_schema() const noexcept { return !schema.empty(); }
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] bool operator==(const ObjectName& lhs, const ObjectName& rhs) noexcept;

struct ObjectNameHash final {
    [[nodiscard]] std::size_t operator()(const ObjectName& name) const noexcept;
};

// Parses bare, [bracketed], "quoted" or `backticked` names with an optional
// schema qualifier. Throws ChainErrc::InvalidObjectName on malformed input.
[[nodiscard]] ObjectName parse_object_name(std::string_view text);

}  // namespace sqlchain::catalog
