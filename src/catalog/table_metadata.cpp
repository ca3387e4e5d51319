#include "sqlchain/catalog/table_metadata.hpp"

#include "sqlchain/core/chain_errors.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace sqlchain::catalog {

namespace {

[[nodiscard]] std::string join_names(const std::vector<std::string>& names)
{
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined.append(", ");
        }
        joined.append(name);
    }
    return joined;
}

[[nodiscard]] std::string describe_filter(PropertiesFilter filter)
{
    if (has_flag(filter, PropertiesFilter::PrimaryKey)) {
        return "primary key";
    }
    if (has_flag(filter, PropertiesFilter::NonPrimaryKey)) {
        return "non-primary key";
    }
    if (has_flag(filter, PropertiesFilter::ObjectDefinedKey)) {
        return "object-defined key";
    }
    if (has_flag(filter, PropertiesFilter::ObjectDefinedNonKey)) {
        return "object-defined non-key";
    }
    return "mapped";
}

}  // namespace

TableOrViewMetadata::TableOrViewMetadata(ObjectName name,
                                         std::string quoted_name,
                                         bool is_table,
                                         std::vector<ColumnMetadata> columns)
    : name_{std::move(name)}
    , quoted_name_{std::move(quoted_name)}
    , is_table_{is_table}
    , columns_{std::move(columns)}
{
    if (name_.empty()) {
        throw std::invalid_argument{"TableOrViewMetadata requires an object name"};
    }
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        const auto& column = columns_[index];
        if (!by_sql_name_.emplace(column.sql_name(), index).second) {
            throw std::invalid_argument{"Duplicate column " + column.sql_name() + " on " + name_.to_string()};
        }
        by_property_name_.emplace(column.property_name(), index);
    }
}

const ColumnMetadata* TableOrViewMetadata::try_get_column(std::string_view name) const noexcept
{
    if (auto it = by_sql_name_.find(name); it != by_sql_name_.end()) {
        return &columns_[it->second];
    }
    if (auto it = by_property_name_.find(name); it != by_property_name_.end()) {
        return &columns_[it->second];
    }
    return nullptr;
}

ColumnPropertyMapList TableOrViewMetadata::properties_for(const model::TypeDescriptor& type,
                                                          PropertiesFilter filter) const
{
    return property_maps_.get_or_create(PropertyKey{type.type(), filter}, [&](const PropertyKey&) {
        return compute_properties(type, filter);
    });
}

std::uint64_t TableOrViewMetadata::property_map_computations() const noexcept
{
    return property_maps_.stats().misses;
}

std::size_t TableOrViewMetadata::PropertyKeyHash::operator()(const PropertyKey& key) const noexcept
{
    return key.type.hash_code() * 31U + static_cast<std::size_t>(key.filter);
}

ColumnPropertyMapList TableOrViewMetadata::compute_properties(const model::TypeDescriptor& type,
                                                              PropertiesFilter filter) const
{
    // Same lookup as try_get_column: the SQL name wins over the property name.
    std::vector<ColumnPropertyMap> all;
    for (const auto& column : columns_) {
        for (const auto& property : type.properties()) {
            if (property.is_mapped() && try_get_column(property.mapped_column_name()) == &column) {
                all.push_back(ColumnPropertyMap{&column, &property});
            }
        }
    }

    auto missing_columns_for = [&](auto&& include_property) {
        std::vector<std::string> missing;
        for (const auto& property : type.properties()) {
            if (!property.is_mapped() || !include_property(property)) {
                continue;
            }
            const auto matched = std::any_of(all.begin(), all.end(), [&](const ColumnPropertyMap& entry) {
                return entry.property == &property;
            });
            if (!matched) {
                missing.push_back(property.name());
            }
        }
        if (!missing.empty()) {
            core::throw_chain_error(core::ChainErrc::MappingFailed,
                                    "The table " + name_.to_string() + " is missing a column mapped to the properties: "
                                        + join_names(missing));
        }
    };

    std::vector<ColumnPropertyMap> result;
    if (has_flag(filter, PropertiesFilter::PrimaryKey)) {
        std::copy_if(all.begin(), all.end(), std::back_inserter(result), [](const ColumnPropertyMap& entry) {
            return entry.column->is_primary_key();
        });
        if (has_flag(filter, PropertiesFilter::ThrowOnMissingProperties)) {
            std::vector<std::string> missing;
            for (const auto& column : columns_) {
                if (!column.is_primary_key()) {
                    continue;
                }
                const auto matched = std::any_of(result.begin(), result.end(), [&](const ColumnPropertyMap& entry) {
                    return entry.column == &column;
                });
                if (!matched) {
                    missing.push_back(column.sql_name());
                }
            }
            if (!missing.empty()) {
                core::throw_chain_error(core::ChainErrc::MappingFailed,
                                        "The type " + type.name()
                                            + " is missing a property mapped to the primary key column(s): "
                                            + join_names(missing) + " on table " + name_.to_string());
            }
        }
    } else if (has_flag(filter, PropertiesFilter::NonPrimaryKey)) {
        std::copy_if(all.begin(), all.end(), std::back_inserter(result), [](const ColumnPropertyMap& entry) {
            return !entry.column->is_primary_key();
        });
        if (has_flag(filter, PropertiesFilter::ThrowOnMissingColumns)) {
            missing_columns_for([](const model::PropertyDescriptor&) { return true; });
        }
    } else if (has_flag(filter, PropertiesFilter::ObjectDefinedKey)) {
        std::copy_if(all.begin(), all.end(), std::back_inserter(result), [](const ColumnPropertyMap& entry) {
            return entry.property->is_key();
        });
        if (has_flag(filter, PropertiesFilter::ThrowOnMissingColumns)) {
            missing_columns_for([](const model::PropertyDescriptor& property) { return property.is_key(); });
        }
    } else if (has_flag(filter, PropertiesFilter::ObjectDefinedNonKey)) {
        std::copy_if(all.begin(), all.end(), std::back_inserter(result), [](const ColumnPropertyMap& entry) {
            return !entry.property->is_key();
        });
        if (has_flag(filter, PropertiesFilter::ThrowOnMissingColumns)) {
            missing_columns_for([](const model::PropertyDescriptor& property) { return !property.is_key(); });
        }
    } else {
        result = all;
        if (has_flag(filter, PropertiesFilter::ThrowOnMissingColumns)) {
            missing_columns_for([](const model::PropertyDescriptor&) { return true; });
        }
    }

    if (has_flag(filter, PropertiesFilter::UpdatableOnly)) {
        result.erase(std::remove_if(result.begin(), result.end(), [](const ColumnPropertyMap& entry) {
                         return !entry.column->is_updatable();
                     }),
                     result.end());
    }

    if (has_flag(filter, PropertiesFilter::ThrowOnNoMatch) && result.empty()) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "None of the properties for " + type.name() + " match the " + describe_filter(filter)
                                    + " columns for " + name_.to_string());
    }

    return std::make_shared<const std::vector<ColumnPropertyMap>>(std::move(result));
}

}  // namespace sqlchain::catalog
