#include "sqlchain/core/identifier.hpp"

#include <cctype>

namespace sqlchain::core {

namespace {

[[nodiscard]] char lower(char ch) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

}  // namespace

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < lhs.size(); ++index) {
        if (lower(lhs[index]) != lower(rhs[index])) {
            return false;
        }
    }
    return true;
}

bool istarts_with(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && iequals(text.substr(0U, prefix.size()), prefix);
}

std::string to_lower_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        result.push_back(lower(ch));
    }
    return result;
}

std::string to_upper_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return result;
}

std::string to_property_name(std::string_view column_name)
{
    std::string result;
    result.reserve(column_name.size());
    for (char ch : column_name) {
        const auto byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte) || ch == '_' || byte >= 0x80U) {
            result.push_back(ch);
        }
    }
    return result;
}

std::size_t CaseInsensitiveHash::operator()(std::string_view text) const noexcept
{
    // FNV-1a over the lower-cased bytes.
    std::size_t hash = 14695981039346656037ULL;
    for (char ch : text) {
        hash ^= static_cast<unsigned char>(lower(ch));
        hash *= 1099511628211ULL;
    }
    return hash;
}

}  // namespace sqlchain::core
