#pragma once

#include "sqlchain/parser/parser_diagnostics.hpp"

#include <tao/pegtl.hpp>

#include <string>
#include <string_view>

namespace sqlchain::parser::detail {

namespace pegtl = tao::pegtl;

[[nodiscard]] std::string unescape_doubled(std::string_view text, char delimiter);

[[nodiscard]] ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source);

[[nodiscard]] ParserDiagnostic make_mismatch(std::string message, std::string_view source);

}  // namespace sqlchain::parser::detail
