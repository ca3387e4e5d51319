#pragma once

#include "sqlchain/catalog/object_name.hpp"
#include "sqlchain/core/value.hpp"

#include <span>
#include <string>
#include <vector>

namespace sqlchain::catalog {

struct ParameterMetadata final {
    std::string sql_name{};
    std::string type_name{};
    core::ValueKind value_kind = core::ValueKind::String;
    bool is_output = false;
};

class StoredProcedureMetadata final {
public:
    StoredProcedureMetadata(ObjectName name, std::string quoted_name, std::vector<ParameterMetadata> parameters)
        : name_{std::move(name)}
        , quoted_name_{std::move(quoted_name)}
        , parameters_{std::move(parameters)}
    {}

    [[nodiscard]] const ObjectName& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& quoted_name() const noexcept { return quoted_name_; }
    [[nodiscard]] std::span<const ParameterMetadata> parameters() const noexcept { return parameters_; }

private:
    ObjectName name_;
    std::string quoted_name_;
    std::vector<ParameterMetadata> parameters_;
};

}  // namespace sqlchain::catalog
