#pragma once

#include "sqlchain/core/value.hpp"

#include <string>

namespace sqlchain::catalog {

struct ColumnDefinition final {
    std::string name{};
    std::string type_name{};
    core::ValueKind value_kind = core::ValueKind::String;
    bool is_primary_key = false;
    bool is_identity = false;
    bool is_computed = false;
    bool is_nullable = true;
};

class ColumnMetadata final {
public:
    ColumnMetadata(ColumnDefinition definition, std::string quoted_name);

    [[nodiscard]] const std::string& sql_name() const noexcept { return definition_.name; }
    [[nodiscard]] const std::string& quoted_sql_name() const noexcept { return quoted_name_; }
    // The name properties are matched against.
    [[nodiscard]] const std::string& property_name() const noexcept { return property_name_; }
    [[nodiscard]] const std::string& type_name() const noexcept { return definition_.type_name; }
    [[nodiscard]] core::ValueKind value_kind() const noexcept { return definition_.value_kind; }
    [[nodiscard]] bool is_primary_key() const noexcept { return definition_.is_primary_key; }
    [[nodiscard]] bool is_identity() const noexcept { return definition_.is_identity; }
    [[nodiscard]] bool is_computed() const noexcept { return definition_.is_computed; }
    [[nodiscard]] bool is_nullable() const noexcept { return definition_.is_nullable; }
    [[nodiscard]] bool is_updatable() const noexcept { return !definition_.is_identity && !definition_.is_computed; }

private:
    ColumnDefinition definition_;
    std::string quoted_name_;
    std::string property_name_;
};

}  // namespace sqlchain::catalog
