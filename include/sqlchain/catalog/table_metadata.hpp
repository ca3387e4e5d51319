#pragma once

#include "sqlchain/catalog/column_metadata.hpp"
#include "sqlchain/catalog/object_name.hpp"
#include "sqlchain/core/identifier.hpp"
#include "sqlchain/core/lazy_cache.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace sqlchain::catalog {

enum class PropertiesFilter : std::uint32_t {
    None = 0U,
    PrimaryKey = 1U << 0U,
    NonPrimaryKey = 1U << 1U,
    ObjectDefinedKey = 1U << 2U,
    ObjectDefinedNonKey = 1U << 3U,
    UpdatableOnly = 1U << 4U,
    ThrowOnMissingProperties = 1U << 5U,
    ThrowOnMissingColumns = 1U << 6U,
    ThrowOnNoMatch = 1U << 7U
};

[[nodiscard]] constexpr PropertiesFilter operator|(PropertiesFilter lhs, PropertiesFilter rhs) noexcept
{
    return static_cast<PropertiesFilter>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr bool has_flag(PropertiesFilter value, PropertiesFilter flag) noexcept
{
    return (static_cast<std::uint32_t>(value) & static_cast<std::uint32_t>(flag)) != 0U;
}

struct ColumnPropertyMap final {
    const ColumnMetadata* column = nullptr;
    const model::PropertyDescriptor* property = nullptr;
};

using ColumnPropertyMapList = std::shared_ptr<const std::vector<ColumnPropertyMap>>;

// Immutable description of a table or view. Column-to-property joins are
// computed once per (type, filter) and shared by every later caller.
class TableOrViewMetadata final {
public:
    TableOrViewMetadata(ObjectName name, std::string quoted_name, bool is_table, std::vector<ColumnMetadata> columns);

    TableOrViewMetadata(const TableOrViewMetadata&) = delete;
    TableOrViewMetadata& operator=(const TableOrViewMetadata&) = delete;

    [[nodiscard]] const ObjectName& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& quoted_name() const noexcept { return quoted_name_; }
    [[nodiscard]] bool is_table() const noexcept { return is_table_; }
    [[nodiscard]] std::span<const ColumnMetadata> columns() const noexcept { return columns_; }

    // Matches the SQL name first, then the property-facing name.
    [[nodiscard]] const ColumnMetadata* try_get_column(std::string_view name) const noexcept;

    [[nodiscard]] ColumnPropertyMapList properties_for(const model::TypeDescriptor& type, PropertiesFilter filter) const;

    [[nodiscard]] std::uint64_t property_map_computations() const noexcept;

private:
    struct PropertyKey final {
        std::type_index type;
        PropertiesFilter filter;

        friend bool operator==(const PropertyKey&, const PropertyKey&) = default;
    };

    struct PropertyKeyHash final {
        [[nodiscard]] std::size_t operator()(const PropertyKey& key) const noexcept;
    };

    [[nodiscard]] ColumnPropertyMapList compute_properties(const model::TypeDescriptor& type,
                                                           PropertiesFilter filter) const;

    ObjectName name_;
    std::string quoted_name_;
    bool is_table_ = true;
    std::vector<ColumnMetadata> columns_;
    std::unordered_map<std::string, std::size_t, core::CaseInsensitiveHash, core::CaseInsensitiveEqual> by_sql_name_{};
    std::unordered_map<std::string, std::size_t, core::CaseInsensitiveHash, core::CaseInsensitiveEqual>
        by_property_name_{};
    mutable core::LazyCache<PropertyKey, ColumnPropertyMapList, PropertyKeyHash> property_maps_{};
};

}  // namespace sqlchain::catalog
