#pragma once

#include <string>
#include <string_view>

namespace sqlchain::builder::detail {

// Lower-cased type name without its length or precision suffix:
// "NVARCHAR(50)" becomes "nvarchar", "double precision" stays as is.
[[nodiscard]] std::string base_type_name(std::string_view type_name);

}  // namespace sqlchain::builder::detail
