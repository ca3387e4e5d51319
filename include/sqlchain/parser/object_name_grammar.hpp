#pragma once

#include "sqlchain/parser/parser_diagnostics.hpp"

#include <string>
#include <string_view>

namespace sqlchain::parser {

struct QualifiedName final {
    std::string schema{};
    std::string name{};
};

ParseResult<QualifiedName> parse_object_name(std::string_view input);

}  // namespace sqlchain::parser
