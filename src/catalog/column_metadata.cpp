#include "sqlchain/catalog/column_metadata.hpp"

#include "sqlchain/core/identifier.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::catalog {

ColumnMetadata::ColumnMetadata(ColumnDefinition definition, std::string quoted_name)
    : definition_{std::move(definition)}
    , quoted_name_{std::move(quoted_name)}
    , property_name_{core::to_property_name(definition_.name)}
{
    if (definition_.name.empty()) {
        throw std::invalid_argument{"ColumnMetadata requires a column name"};
    }
}

}  // namespace sqlchain::catalog
