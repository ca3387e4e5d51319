#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sqlchain::parser {

struct ParserDiagnostic final {
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string input{};
};

template <typename T>
struct ParseResult final {
    std::optional<T> ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return ast.has_value(); }
};

}  // namespace sqlchain::parser
