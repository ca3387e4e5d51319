#pragma once

#include "sqlchain/parser/parser_diagnostics.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlchain::parser {

struct ParameterScan final {
    // Distinct @name markers in order of first appearance, without the '@'.
    std::vector<std::string> named{};
    std::size_t positional = 0U;
};

// Finds parameter markers in SQL text, skipping string literals, quoted
// identifiers, comments and @@system variables.
ParseResult<ParameterScan> scan_parameter_markers(std::string_view input);

}  // namespace sqlchain::parser
