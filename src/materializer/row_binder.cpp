#include "sqlchain/materializer/row_binder.hpp"

#include "sqlchain/core/identifier.hpp"

#include <string>

namespace sqlchain::materializer {

namespace {

void collect_targets(const model::TypeDescriptor& type,
                     const std::string& prefix,
                     std::string_view column,
                     std::vector<const model::PropertyDescriptor*>& path,
                     std::vector<ColumnTarget>& out)
{
    for (const auto& property : type.properties()) {
        if (!property.can_write()) {
            continue;
        }
        if (property.is_decomposed()) {
            path.push_back(&property);
            collect_targets(*property.decomposed_type(), prefix + property.decomposition_prefix(), column, path, out);
            path.pop_back();
        } else if (property.is_mapped() && core::iequals(prefix + property.mapped_column_name(), column)) {
            out.push_back(ColumnTarget{path, &property});
        }
    }
}

void collect_children(const model::TypeDescriptor& type,
                      std::vector<const model::PropertyDescriptor*>& path,
                      std::vector<std::vector<const model::PropertyDescriptor*>>& out)
{
    for (const auto& property : type.properties()) {
        if (!property.is_decomposed() || !property.can_write()) {
            continue;
        }
        path.push_back(&property);
        out.push_back(path);
        collect_children(*property.decomposed_type(), path, out);
        path.pop_back();
    }
}

}  // namespace

std::vector<ColumnTarget> resolve_column(const model::TypeDescriptor& type, std::string_view column)
{
    std::vector<ColumnTarget> targets;
    std::vector<const model::PropertyDescriptor*> path;
    collect_targets(type, std::string{}, column, path, targets);
    return targets;
}

std::vector<std::vector<const model::PropertyDescriptor*>> child_paths(const model::TypeDescriptor& type)
{
    std::vector<std::vector<const model::PropertyDescriptor*>> paths;
    std::vector<const model::PropertyDescriptor*> path;
    collect_children(type, path, paths);
    return paths;
}

void* resolve_owner(void* object, const std::vector<const model::PropertyDescriptor*>& path)
{
    for (const auto* step : path) {
        object = step->ensure_child(object);
    }
    return object;
}

void bind_row(const execution::RowCursor& cursor, const model::TypeDescriptor& type, void* object)
{
    for (const auto& path : child_paths(type)) {
        (void)resolve_owner(object, path);
    }

    const auto field_count = cursor.field_count();
    for (std::size_t index = 0U; index < field_count; ++index) {
        const auto targets = resolve_column(type, cursor.name(index));
        if (targets.empty()) {
            continue;
        }
        const auto value = cursor.is_null(index) ? core::Value{} : cursor.get_value(index);
        for (const auto& target : targets) {
            target.property->set(resolve_owner(object, target.path), value);
        }
    }

    type.accept_changes(object);
}

}  // namespace sqlchain::materializer
