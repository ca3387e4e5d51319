#include "sqlchain/model/type_descriptor.hpp"

#include "sqlchain/core/identifier.hpp"

#include <stdexcept>

namespace sqlchain::model {

namespace {

void append_columns(const TypeDescriptor& type, const std::string& prefix, std::vector<std::string>& out)
{
    for (const auto& property : type.properties()) {
        if (!property.can_write()) {
            continue;
        }
        if (property.is_decomposed()) {
            append_columns(*property.decomposed_type(), prefix + property.decomposition_prefix(), out);
        } else if (property.is_mapped()) {
            out.push_back(prefix + property.mapped_column_name());
        }
    }
}

}  // namespace

PropertyDescriptor::PropertyDescriptor(Definition definition)
    : definition_{std::move(definition)}
{
    if (definition_.name.empty()) {
        throw std::invalid_argument{"PropertyDescriptor requires a property name"};
    }
}

core::Value PropertyDescriptor::get(const void* object) const
{
    if (!definition_.getter) {
        throw std::logic_error{"Property " + definition_.owner + "." + definition_.name + " is not readable"};
    }
    return definition_.getter(object);
}

void PropertyDescriptor::set(void* object, const core::Value& value) const
{
    if (value.is_null()) {
        assign(object, value);
        return;
    }

    core::Value converted;
    try {
        converted = core::convert_value(value, definition_.kind);
    } catch (const std::system_error& error) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "Cannot map value to property " + definition_.owner + "." + definition_.name + ": "
                                    + error.what());
    }
    assign(object, converted);
}

void PropertyDescriptor::assign(void* object, const core::Value& value) const
{
    if (!definition_.setter) {
        throw std::logic_error{"Property " + definition_.owner + "." + definition_.name + " is not writable"};
    }
    if (value.is_null() && !definition_.nullable) {
        core::throw_chain_error(core::ChainErrc::MappingFailed,
                                "Cannot assign NULL to non-nullable property " + definition_.owner + "."
                                    + definition_.name);
    }
    definition_.setter(object, value);
}

void* PropertyDescriptor::ensure_child(void* object) const
{
    if (!definition_.child_resolver) {
        throw std::logic_error{"Property " + definition_.owner + "." + definition_.name + " is not decomposed"};
    }
    return definition_.child_resolver(object);
}

TypeDescriptor::TypeDescriptor(std::string name,
                               std::type_index type,
                               std::vector<PropertyDescriptor> properties,
                               Finalizer accept_changes)
    : name_{std::move(name)}
    , type_{type}
    , properties_{std::move(properties)}
    , accept_changes_{std::move(accept_changes)}
{
    append_columns(*this, std::string{}, columns_for_);
}

const PropertyDescriptor* TypeDescriptor::find_property(std::string_view name) const noexcept
{
    for (const auto& property : properties_) {
        if (core::iequals(property.name(), name)) {
            return &property;
        }
    }
    return nullptr;
}

void TypeDescriptor::accept_changes(void* object) const
{
    if (accept_changes_) {
        accept_changes_(object);
    }
}

}  // namespace sqlchain::model
