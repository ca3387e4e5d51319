#pragma once

#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/value.hpp"

#include <concepts>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace sqlchain::model {

class TypeDescriptor;

class PropertyDescriptor final {
public:
    using Getter = std::function<core::Value(const void* object)>;
    using Setter = std::function<void(void* object, const core::Value& value)>;
    using ChildResolver = std::function<void*(void* object)>;

    struct Definition final {
        std::string name{};
        std::string owner{};
        std::string mapped_column{};
        core::ValueKind kind = core::ValueKind::Null;
        bool nullable = false;
        bool is_key = false;
        bool mapped = true;
        Getter getter{};
        Setter setter{};
        const TypeDescriptor* decomposed_type = nullptr;
        std::string decomposition_prefix{};
        ChildResolver child_resolver{};
    };

    explicit PropertyDescriptor(Definition definition);

    [[nodiscard]] const std::string& name() const noexcept { return definition_.name; }
    [[nodiscard]] const std::string& owner_name() const noexcept { return definition_.owner; }
    // Empty when the property is not mapped to a column.
    [[nodiscard]] const std::string& mapped_column_name() const noexcept { return definition_.mapped_column; }
    [[nodiscard]] bool is_mapped() const noexcept { return !definition_.mapped_column.empty(); }
    [[nodiscard]] core::ValueKind value_kind() const noexcept { return definition_.kind; }
    [[nodiscard]] bool is_nullable() const noexcept { return definition_.nullable; }
    [[nodiscard]] bool is_key() const noexcept { return definition_.is_key; }
    [[nodiscard]] bool can_read() const noexcept { return static_cast<bool>(definition_.getter); }
    [[nodiscard]] bool can_write() const noexcept
    {
        return static_cast<bool>(definition_.setter) || static_cast<bool>(definition_.child_resolver);
    }
    [[nodiscard]] bool is_decomposed() const noexcept { return definition_.decomposed_type != nullptr; }
    [[nodiscard]] const TypeDescriptor* decomposed_type() const noexcept { return definition_.decomposed_type; }
    [[nodiscard]] const std::string& decomposition_prefix() const noexcept { return definition_.decomposition_prefix; }

    [[nodiscard]] core::Value get(const void* object) const;

    // Converts to the property kind, then assigns.
    void set(void* object, const core::Value& value) const;

    // Assigns a value that already has the property kind (or is NULL).
    void assign(void* object, const core::Value& value) const;

    // Returns the decomposed child, constructing it first when it is absent.
    [[nodiscard]] void* ensure_child(void* object) const;

private:
    Definition definition_;
};

class TypeDescriptor final {
public:
    using Finalizer = std::function<void(void* object)>;

    TypeDescriptor(std::string name,
                   std::type_index type,
                   std::vector<PropertyDescriptor> properties,
                   Finalizer accept_changes);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::type_index type() const noexcept { return type_; }
    [[nodiscard]] std::span<const PropertyDescriptor> properties() const noexcept { return properties_; }
    [[nodiscard]] const PropertyDescriptor* find_property(std::string_view name) const noexcept;

    // Column names a materializer of this type asks for, decomposed children included.
    [[nodiscard]] const std::vector<std::string>& columns_for() const noexcept { return columns_for_; }

    [[nodiscard]] bool supports_change_tracking() const noexcept { return static_cast<bool>(accept_changes_); }
    void accept_changes(void* object) const;

private:
    std::string name_;
    std::type_index type_;
    std::vector<PropertyDescriptor> properties_;
    Finalizer accept_changes_;
    std::vector<std::string> columns_for_{};
};

template <typename T>
class TypeDescriptorBuilder;

// Specialize with `static void describe(TypeDescriptorBuilder<T>& builder)`.
template <typename T>
struct TypeMapping;

template <typename T>
concept MappedType = std::is_default_constructible_v<T> && requires(TypeDescriptorBuilder<T>& builder) {
    TypeMapping<T>::describe(builder);
};

template <typename T>
concept ChangeTracking = requires(T& object) { object.accept_changes(); };

template <typename M>
struct FieldTraits;

template <>
struct FieldTraits<bool> {
    static constexpr core::ValueKind kind = core::ValueKind::Boolean;
    static constexpr bool nullable = false;
    static core::Value to_value(const bool& field) { return core::Value{field}; }
    static void assign(bool& field, const core::Value& value) { field = value.as_bool(); }
};

template <>
struct FieldTraits<std::int32_t> {
    static constexpr core::ValueKind kind = core::ValueKind::Int32;
    static constexpr bool nullable = false;
    static core::Value to_value(const std::int32_t& field) { return core::Value{field}; }
    static void assign(std::int32_t& field, const core::Value& value) { field = value.as_int32(); }
};

template <>
struct FieldTraits<std::int64_t> {
    static constexpr core::ValueKind kind = core::ValueKind::Int64;
    static constexpr bool nullable = false;
    static core::Value to_value(const std::int64_t& field) { return core::Value{field}; }
    static void assign(std::int64_t& field, const core::Value& value) { field = value.as_int64(); }
};

template <>
struct FieldTraits<double> {
    static constexpr core::ValueKind kind = core::ValueKind::Double;
    static constexpr bool nullable = false;
    static core::Value to_value(const double& field) { return core::Value{field}; }
    static void assign(double& field, const core::Value& value) { field = value.as_double(); }
};

// Strings and blobs accept NULL by clearing.
template <>
struct FieldTraits<std::string> {
    static constexpr core::ValueKind kind = core::ValueKind::String;
    static constexpr bool nullable = true;
    static core::Value to_value(const std::string& field) { return core::Value{field}; }
    static void assign(std::string& field, const core::Value& value)
    {
        if (value.is_null()) {
            field.clear();
        } else {
            field = value.as_string();
        }
    }
};

template <>
struct FieldTraits<core::Blob> {
    static constexpr core::ValueKind kind = core::ValueKind::Binary;
    static constexpr bool nullable = true;
    static core::Value to_value(const core::Blob& field) { return core::Value{field}; }
    static void assign(core::Blob& field, const core::Value& value)
    {
        if (value.is_null()) {
            field.clear();
        } else {
            field = value.as_blob();
        }
    }
};

template <typename U>
struct FieldTraits<std::optional<U>> {
    static constexpr core::ValueKind kind = FieldTraits<U>::kind;
    static constexpr bool nullable = true;
    static core::Value to_value(const std::optional<U>& field)
    {
        return field ? FieldTraits<U>::to_value(*field) : core::Value{};
    }
    static void assign(std::optional<U>& field, const core::Value& value)
    {
        if (value.is_null()) {
            field.reset();
            return;
        }
        U inner{};
        FieldTraits<U>::assign(inner, value);
        field = std::move(inner);
    }
};

template <typename M>
concept MappableField = requires { FieldTraits<M>::kind; };

template <MappedType T>
const TypeDescriptor& type_descriptor();

template <typename T>
class TypeDescriptorBuilder final {
public:
    class PropertyOptions final {
    public:
        explicit PropertyOptions(PropertyDescriptor::Definition& definition) noexcept : definition_{&definition} {}

        PropertyOptions& column(std::string column_name)
        {
            definition_->mapped_column = std::move(column_name);
            return *this;
        }

        PropertyOptions& key()
        {
            definition_->is_key = true;
            return *this;
        }

        PropertyOptions& not_mapped()
        {
            definition_->mapped = false;
            return *this;
        }

        PropertyOptions& read_only()
        {
            definition_->setter = nullptr;
            return *this;
        }

    private:
        PropertyDescriptor::Definition* definition_;
    };

    explicit TypeDescriptorBuilder(std::string type_name) : type_name_{std::move(type_name)} {}

    void name(std::string type_name) { type_name_ = std::move(type_name); }

    template <MappableField M>
    PropertyOptions property(std::string name, M T::*member)
    {
        auto& definition = add_field<M>(std::move(name));
        definition.getter = [member](const void* object) {
            return FieldTraits<M>::to_value(static_cast<const T*>(object)->*member);
        };
        definition.setter = [member](void* object, const core::Value& value) {
            FieldTraits<M>::assign(static_cast<T*>(object)->*member, value);
        };
        return PropertyOptions{definition};
    }

    template <typename R, typename A>
        requires MappableField<std::remove_cvref_t<R>>
    PropertyOptions property(std::string name, R (T::*getter)() const, void (T::*setter)(A))
    {
        using M = std::remove_cvref_t<R>;
        auto& definition = add_field<M>(std::move(name));
        definition.getter = [getter](const void* object) {
            return FieldTraits<M>::to_value((static_cast<const T*>(object)->*getter)());
        };
        definition.setter = [setter](void* object, const core::Value& value) {
            M field{};
            FieldTraits<M>::assign(field, value);
            (static_cast<T*>(object)->*setter)(std::move(field));
        };
        return PropertyOptions{definition};
    }

    template <typename R>
        requires MappableField<std::remove_cvref_t<R>>
    PropertyOptions property(std::string name, R (T::*getter)() const)
    {
        using M = std::remove_cvref_t<R>;
        auto& definition = add_field<M>(std::move(name));
        definition.getter = [getter](const void* object) {
            return FieldTraits<M>::to_value((static_cast<const T*>(object)->*getter)());
        };
        return PropertyOptions{definition};
    }

    template <MappedType N>
    PropertyOptions decompose(std::string name, N T::*member, std::string prefix = {})
    {
        auto& definition = add_child<N>(std::move(name), std::move(prefix));
        definition.child_resolver = [member](void* object) -> void* {
            return &(static_cast<T*>(object)->*member);
        };
        return PropertyOptions{definition};
    }

    template <MappedType N>
    PropertyOptions decompose(std::string name, std::unique_ptr<N> T::*member, std::string prefix = {})
    {
        auto& definition = add_child<N>(std::move(name), std::move(prefix));
        definition.child_resolver = [member](void* object) -> void* {
            auto& slot = static_cast<T*>(object)->*member;
            if (!slot) {
                slot = std::make_unique<N>();
            }
            return slot.get();
        };
        return PropertyOptions{definition};
    }

    template <MappedType N>
    PropertyOptions decompose(std::string name, std::optional<N> T::*member, std::string prefix = {})
    {
        auto& definition = add_child<N>(std::move(name), std::move(prefix));
        definition.child_resolver = [member](void* object) -> void* {
            auto& slot = static_cast<T*>(object)->*member;
            if (!slot) {
                slot.emplace();
            }
            return &*slot;
        };
        return PropertyOptions{definition};
    }

    [[nodiscard]] TypeDescriptor build() &&
    {
        std::vector<PropertyDescriptor> properties;
        properties.reserve(definitions_.size());
        for (auto& definition : definitions_) {
            definition.owner = type_name_;
            if (!definition.mapped || definition.decomposed_type != nullptr) {
                definition.mapped_column.clear();
            }
            properties.emplace_back(std::move(definition));
        }

        TypeDescriptor::Finalizer finalizer{};
        if constexpr (ChangeTracking<T>) {
            finalizer = [](void* object) { static_cast<T*>(object)->accept_changes(); };
        }
        return TypeDescriptor{std::move(type_name_), std::type_index{typeid(T)}, std::move(properties), std::move(finalizer)};
    }

private:
    template <typename M>
    PropertyDescriptor::Definition& add_field(std::string name)
    {
        auto& definition = definitions_.emplace_back();
        definition.mapped_column = name;
        definition.name = std::move(name);
        definition.kind = FieldTraits<M>::kind;
        definition.nullable = FieldTraits<M>::nullable;
        return definition;
    }

    template <typename N>
    PropertyDescriptor::Definition& add_child(std::string name, std::string prefix)
    {
        auto& definition = definitions_.emplace_back();
        definition.name = std::move(name);
        definition.nullable = true;
        definition.decomposed_type = &type_descriptor<N>();
        definition.decomposition_prefix = std::move(prefix);
        return definition;
    }

    std::string type_name_;
    std::deque<PropertyDescriptor::Definition> definitions_{};
};

template <MappedType T>
const TypeDescriptor& type_descriptor()
{
    static const TypeDescriptor descriptor = [] {
        TypeDescriptorBuilder<T> builder{typeid(T).name()};
        TypeMapping<T>::describe(builder);
        return std::move(builder).build();
    }();
    return descriptor;
}

}  // namespace sqlchain::model
