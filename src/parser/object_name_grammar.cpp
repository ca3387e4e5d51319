#include "sqlchain/parser/object_name_grammar.hpp"

#include "grammar_support.hpp"

#include <tao/pegtl.hpp>

#include <vector>

namespace sqlchain::parser {

namespace {

namespace pegtl = tao::pegtl;

struct optional_space : pegtl::star<pegtl::space> {
};

struct bracket_body : pegtl::plus<pegtl::sor<pegtl::string<']', ']'>, pegtl::not_one<']'>>> {
};

struct bracket_part : pegtl::seq<pegtl::one<'['>, bracket_body, pegtl::one<']'>> {
};

struct quoted_body : pegtl::plus<pegtl::sor<pegtl::string<'"', '"'>, pegtl::not_one<'"'>>> {
};

struct quoted_part : pegtl::seq<pegtl::one<'"'>, quoted_body, pegtl::one<'"'>> {
};

struct backtick_body : pegtl::plus<pegtl::sor<pegtl::string<'`', '`'>, pegtl::not_one<'`'>>> {
};

struct backtick_part : pegtl::seq<pegtl::one<'`'>, backtick_body, pegtl::one<'`'>> {
};

struct bare_part
    : pegtl::plus<pegtl::sor<pegtl::ranges<'a', 'z', 'A', 'Z', '0', '9'>,
                             pegtl::one<'_', '$', '#', '@'>,
                             pegtl::utf8::range<0x80, 0x10FFFF>>> {
};

struct name_part : pegtl::sor<bracket_part, quoted_part, backtick_part, bare_part> {
};

struct object_name_grammar
    : pegtl::seq<optional_space,
                 name_part,
                 pegtl::opt<pegtl::seq<optional_space, pegtl::one<'.'>, optional_space, name_part>>,
                 optional_space,
                 pegtl::eof> {
};

template <typename Rule>
struct object_name_action {
    template <typename Input>
    static void apply(const Input&, std::vector<std::string>&)
    {
    }
};

template <>
struct object_name_action<bracket_body> {
    template <typename Input>
    static void apply(const Input& in, std::vector<std::string>& parts)
    {
        parts.push_back(detail::unescape_doubled(in.string_view(), ']'));
    }
};

template <>
struct object_name_action<quoted_body> {
    template <typename Input>
    static void apply(const Input& in, std::vector<std::string>& parts)
    {
        parts.push_back(detail::unescape_doubled(in.string_view(), '"'));
    }
};

template <>
struct object_name_action<backtick_body> {
    template <typename Input>
    static void apply(const Input& in, std::vector<std::string>& parts)
    {
        parts.push_back(detail::unescape_doubled(in.string_view(), '`'));
    }
};

template <>
struct object_name_action<bare_part> {
    template <typename Input>
    static void apply(const Input& in, std::vector<std::string>& parts)
    {
        parts.push_back(in.string());
    }
};

}  // namespace

ParseResult<QualifiedName> parse_object_name(std::string_view input)
{
    ParseResult<QualifiedName> result{};
    pegtl::memory_input in(input.data(), input.size(), "object_name");
    std::vector<std::string> parts;

    try {
        const auto parsed = pegtl::parse<object_name_grammar, object_name_action>(in, parts);
        if (parsed && !parts.empty()) {
            QualifiedName name{};
            if (parts.size() == 2U) {
                name.schema = std::move(parts.front());
            }
            name.name = std::move(parts.back());
            result.ast = std::move(name);
        } else {
            result.diagnostics.push_back(
                detail::make_mismatch("expected [schema.]name with at most one qualifier", input));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(detail::make_parse_error(error, input));
    }

    return result;
}

}  // namespace sqlchain::parser
