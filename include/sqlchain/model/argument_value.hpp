#pragma once

#include "sqlchain/core/value.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlchain::model {

struct ArgumentEntry final {
    std::string name{};
    core::Value value{};
    const PropertyDescriptor* property = nullptr;
};

// Snapshot of the values a write or filter operation binds: either the mapped
// properties of a described object or the entries of a name/value map.
class ArgumentValue final {
public:
    ArgumentValue() = default;

    [[nodiscard]] static ArgumentValue from_map(core::ValueMap values);

    template <MappedType T>
    [[nodiscard]] static ArgumentValue from_object(const T& object)
    {
        const auto& type = type_descriptor<T>();
        ArgumentValue argument;
        argument.type_ = &type;
        for (const auto& property : type.properties()) {
            if (!property.is_mapped() || !property.can_read()) {
                continue;
            }
            argument.entries_.push_back(ArgumentEntry{property.mapped_column_name(), property.get(&object), &property});
        }
        return argument;
    }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty() && type_ == nullptr; }
    [[nodiscard]] bool is_object() const noexcept { return type_ != nullptr; }
    [[nodiscard]] const TypeDescriptor* type() const noexcept { return type_; }
    [[nodiscard]] std::span<const ArgumentEntry> entries() const noexcept { return entries_; }
    [[nodiscard]] const ArgumentEntry* find(std::string_view name) const noexcept;
    [[nodiscard]] const ArgumentEntry* find(const PropertyDescriptor& property) const noexcept;
    [[nodiscard]] std::string describe() const;

private:
    const TypeDescriptor* type_ = nullptr;
    std::vector<ArgumentEntry> entries_{};
};

}  // namespace sqlchain::model
