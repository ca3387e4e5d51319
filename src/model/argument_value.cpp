#include "sqlchain/model/argument_value.hpp"

#include "sqlchain/core/identifier.hpp"

namespace sqlchain::model {

ArgumentValue ArgumentValue::from_map(core::ValueMap values)
{
    ArgumentValue argument;
    argument.entries_.reserve(values.size());
    for (auto& [name, value] : values) {
        argument.entries_.push_back(ArgumentEntry{std::move(name), std::move(value), nullptr});
    }
    return argument;
}

const ArgumentEntry* ArgumentValue::find(std::string_view name) const noexcept
{
    for (const auto& entry : entries_) {
        if (core::iequals(entry.name, name)) {
            return &entry;
        }
    }
    return nullptr;
}

const ArgumentEntry* ArgumentValue::find(const PropertyDescriptor& property) const noexcept
{
    for (const auto& entry : entries_) {
        if (entry.property == &property) {
            return &entry;
        }
    }
    return nullptr;
}

std::string ArgumentValue::describe() const
{
    return type_ != nullptr ? type_->name() : std::string{"value map"};
}

}  // namespace sqlchain::model
