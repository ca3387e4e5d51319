#include "grammar_support.hpp"

namespace sqlchain::parser::detail {

std::string unescape_doubled(std::string_view text, char delimiter)
{
    std::string result;
    result.reserve(text.size());
    for (std::size_t index = 0U; index < text.size(); ++index) {
        result.push_back(text[index]);
        if (text[index] == delimiter && index + 1U < text.size() && text[index + 1U] == delimiter) {
            ++index;
        }
    }
    return result;
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.message = std::string{error.message()};
    diagnostic.input = std::string{source};
    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);
        if (position.byte >= source.size()) {
            diagnostic.message += " at end of input";
        }
    }
    return diagnostic;
}

ParserDiagnostic make_mismatch(std::string message, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.message = std::move(message);
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    diagnostic.input = std::string{source};
    return diagnostic;
}

}  // namespace sqlchain::parser::detail
