#include "sqlchain/catalog/object_name.hpp"

#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/identifier.hpp"
#include "sqlchain/parser/object_name_grammar.hpp"

namespace sqlchain::catalog {

std::string ObjectName::to_string() const
{
    if (schema.empty()) {
        return name;
    }
    return schema + "." + name;
}

bool operator==(const ObjectName& lhs, const ObjectName& rhs) noexcept
{
    return core::iequals(lhs.schema, rhs.schema) && core::iequals(lhs.name, rhs.name);
}

std::size_t ObjectNameHash::operator()(const ObjectName& name) const noexcept
{
    const core::CaseInsensitiveHash hash{};
    return hash(name.schema) * 31U + hash(name.name);
}

ObjectName parse_object_name(std::string_view text)
{
    auto result = parser::parse_object_name(text);
    if (!result.success()) {
        const auto& diagnostic = result.diagnostics.front();
        core::throw_chain_error(core::ChainErrc::InvalidObjectName,
                                "Invalid object name '" + std::string{text} + "': " + diagnostic.message);
    }
    ObjectName name{};
    name.schema = std::move(result.ast->schema);
    name.name = std::move(result.ast->name);
    return name;
}

}  // namespace sqlchain::catalog
