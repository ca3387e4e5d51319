#pragma once

#include "sqlchain/execution/native_command.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <string_view>
#include <vector>

namespace sqlchain::materializer {

// A property a result column binds to. `path` lists the decomposed
// properties leading from the root object to the property's owner.
struct ColumnTarget final {
    std::vector<const model::PropertyDescriptor*> path{};
    const model::PropertyDescriptor* property = nullptr;
};

// Every writable property matching `column` case-insensitively, decomposed
// children included with their column prefixes, in declaration order.
[[nodiscard]] std::vector<ColumnTarget> resolve_column(const model::TypeDescriptor& type, std::string_view column);

// Paths of every writable decomposed child, parents before children.
[[nodiscard]] std::vector<std::vector<const model::PropertyDescriptor*>> child_paths(const model::TypeDescriptor& type);

// Walks `path` from `object`, constructing absent children on the way.
[[nodiscard]] void* resolve_owner(void* object, const std::vector<const model::PropertyDescriptor*>& path);

// Interpreted tier: resolves and converts column by column for the cursor's
// current row, then accepts changes on the root object.
void bind_row(const execution::RowCursor& cursor, const model::TypeDescriptor& type, void* object);

}  // namespace sqlchain::materializer
