#include "sqlchain/parser/parameter_scanner.hpp"

#include "grammar_support.hpp"

#include "sqlchain/core/identifier.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>

namespace sqlchain::parser {

namespace {

namespace pegtl = tao::pegtl;

template <char Delimiter>
struct delimited_body : pegtl::star<pegtl::sor<pegtl::string<Delimiter, Delimiter>, pegtl::not_one<Delimiter>>> {
};

template <char Open, char Close>
struct delimited : pegtl::if_must<pegtl::one<Open>, delimited_body<Close>, pegtl::one<Close>> {
};

struct string_literal : delimited<'\'', '\''> {
};

struct quoted_identifier : delimited<'"', '"'> {
};

struct bracket_identifier : delimited<'[', ']'> {
};

struct backtick_identifier : delimited<'`', '`'> {
};

struct line_comment : pegtl::seq<pegtl::string<'-', '-'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment : pegtl::if_must<pegtl::string<'/', '*'>, pegtl::until<pegtl::string<'*', '/'>>> {
};

struct marker_name : pegtl::plus<pegtl::ranges<'a', 'z', 'A', 'Z', '0', '9', '_'>> {
};

struct system_variable : pegtl::seq<pegtl::string<'@', '@'>, pegtl::opt<marker_name>> {
};

struct named_marker : pegtl::seq<pegtl::one<'@'>, marker_name> {
};

struct positional_marker : pegtl::one<'?'> {
};

struct sql_token : pegtl::sor<string_literal,
                              quoted_identifier,
                              bracket_identifier,
                              backtick_identifier,
                              line_comment,
                              block_comment,
                              system_variable,
                              named_marker,
                              positional_marker,
                              pegtl::any> {
};

struct scanner_grammar : pegtl::seq<pegtl::star<sql_token>, pegtl::eof> {
};

template <typename Rule>
struct scanner_action {
    template <typename Input>
    static void apply(const Input&, ParameterScan&)
    {
    }
};

template <>
struct scanner_action<named_marker> {
    template <typename Input>
    static void apply(const Input& in, ParameterScan& scan)
    {
        const auto name = in.string_view().substr(1U);
        const auto exists = std::any_of(scan.named.begin(), scan.named.end(), [&](const std::string& existing) {
            return core::iequals(existing, name);
        });
        if (!exists) {
            scan.named.emplace_back(name);
        }
    }
};

template <>
struct scanner_action<positional_marker> {
    template <typename Input>
    static void apply(const Input&, ParameterScan& scan)
    {
        ++scan.positional;
    }
};

}  // namespace

ParseResult<ParameterScan> scan_parameter_markers(std::string_view input)
{
    ParseResult<ParameterScan> result{};
    pegtl::memory_input in(input.data(), input.size(), "sql_text");
    ParameterScan scan{};

    try {
        if (pegtl::parse<scanner_grammar, scanner_action>(in, scan)) {
            result.ast = std::move(scan);
        } else {
            result.diagnostics.push_back(detail::make_mismatch("unable to scan SQL text", input));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(detail::make_parse_error(error, input));
    }

    return result;
}

}  // namespace sqlchain::parser
