#include "sqlchain/materializer/compiled_binder.hpp"

#include "sqlchain/core/identifier.hpp"
#include "sqlchain/materializer/row_binder.hpp"

#include <functional>
#include <utility>

namespace sqlchain::materializer {

namespace {

core::Value read_bool(const execution::RowCursor& cursor, std::size_t index)
{
    return core::Value{cursor.get_bool(index)};
}

core::Value read_int32(const execution::RowCursor& cursor, std::size_t index)
{
    return core::Value{cursor.get_int32(index)};
}

core::Value read_int64(const execution::RowCursor& cursor, std::size_t index)
{
    return core::Value{cursor.get_int64(index)};
}

core::Value read_double(const execution::RowCursor& cursor, std::size_t index)
{
    return core::Value{cursor.get_double(index)};
}

core::Value read_string(const execution::RowCursor& cursor, std::size_t index)
{
    return core::Value{cursor.get_string(index)};
}

core::Value read_blob(const execution::RowCursor& cursor, std::size_t index)
{
    return core::Value{cursor.get_blob(index)};
}

core::Value read_any(const execution::RowCursor& cursor, std::size_t index)
{
    return cursor.get_value(index);
}

}  // namespace

CompiledBinder::CompiledBinder(const execution::RowCursor& cursor, const model::TypeDescriptor& type)
    : type_{&type}
    , children_{child_paths(type)}
{
    const auto field_count = cursor.field_count();
    for (std::size_t index = 0U; index < field_count; ++index) {
        const auto field_kind = cursor.field_type(index);
        Reader reader = &read_any;
        switch (field_kind) {
        case core::ValueKind::Boolean:
            reader = &read_bool;
            break;
        case core::ValueKind::Int32:
            reader = &read_int32;
            break;
        case core::ValueKind::Int64:
            reader = &read_int64;
            break;
        case core::ValueKind::Double:
            reader = &read_double;
            break;
        case core::ValueKind::String:
            reader = &read_string;
            break;
        case core::ValueKind::Binary:
            reader = &read_blob;
            break;
        case core::ValueKind::Null:
            break;
        }

        for (auto& target : resolve_column(type, cursor.name(index))) {
            Step step{};
            step.column = index;
            step.path = std::move(target.path);
            step.property = target.property;
            step.reader = reader;
            step.convert = field_kind != target.property->value_kind();
            steps_.push_back(std::move(step));
        }
    }
}

void CompiledBinder::bind(const execution::RowCursor& cursor, void* object) const
{
    for (const auto& path : children_) {
        (void)resolve_owner(object, path);
    }

    for (const auto& step : steps_) {
        auto* owner = resolve_owner(object, step.path);
        if (cursor.is_null(step.column)) {
            step.property->assign(owner, core::Value{});
            continue;
        }
        const auto value = step.reader(cursor, step.column);
        if (step.convert) {
            step.property->set(owner, value);
        } else {
            step.property->assign(owner, value);
        }
    }

    type_->accept_changes(object);
}

std::size_t CompiledBinderCache::KeyHash::operator()(const Key& key) const noexcept
{
    return std::hash<std::string>{}(key.command_text) * 31U + key.type.hash_code();
}

std::shared_ptr<const CompiledBinder> CompiledBinderCache::get_or_compile(std::string_view command_text,
                                                                          const execution::RowCursor& cursor,
                                                                          const model::TypeDescriptor& type)
{
    bool compiled = false;
    try {
        auto binder = binders_.get_or_create(Key{std::string{command_text}, type.type()},
                                             [&](const Key&) {
                                                 compiled = true;
                                                 return std::make_shared<const CompiledBinder>(cursor, type);
                                             });
        if (telemetry_ != nullptr) {
            if (compiled) {
                telemetry_->record_binder_compiled(true);
            } else {
                telemetry_->record_binder_cache_hit();
            }
        }
        return binder;
    } catch (const std::exception&) {
        if (compiled && telemetry_ != nullptr) {
            telemetry_->record_binder_compiled(false);
        }
        throw;
    }
}

}  // namespace sqlchain::materializer
