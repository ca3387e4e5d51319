#include "type_names.hpp"

#include "sqlchain/core/identifier.hpp"

namespace sqlchain::builder::detail {

std::string base_type_name(std::string_view type_name)
{
    const auto paren = type_name.find('(');
    if (paren != std::string_view::npos) {
        type_name = type_name.substr(0, paren);
    }
    while (!type_name.empty() && (type_name.back() == ' ' || type_name.back() == '\t')) {
        type_name.remove_suffix(1U);
    }
    while (!type_name.empty() && (type_name.front() == ' ' || type_name.front() == '\t')) {
        type_name.remove_prefix(1U);
    }
    return core::to_lower_copy(type_name);
}

}  // namespace sqlchain::builder::detail
