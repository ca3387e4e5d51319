#pragma once

#include "sqlchain/core/chain_telemetry.hpp"
#include "sqlchain/core/lazy_cache.hpp"
#include "sqlchain/execution/native_command.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace sqlchain::materializer {

// Compiled tier: the column-to-property plan for one result shape, built
// once from the cursor's schema and replayed for every row.
class CompiledBinder final {
public:
    CompiledBinder(const execution::RowCursor& cursor, const model::TypeDescriptor& type);

    void bind(const execution::RowCursor& cursor, void* object) const;

    [[nodiscard]] const model::TypeDescriptor& type() const noexcept { return *type_; }
    [[nodiscard]] std::size_t step_count() const noexcept { return steps_.size(); }

private:
    using Reader = core::Value (*)(const execution::RowCursor& cursor, std::size_t index);

    struct Step final {
        std::size_t column = 0U;
        std::vector<const model::PropertyDescriptor*> path{};
        const model::PropertyDescriptor* property = nullptr;
        Reader reader = nullptr;
        // Field kind differs from the property kind.
        bool convert = false;
    };

    const model::TypeDescriptor* type_;
    std::vector<std::vector<const model::PropertyDescriptor*>> children_{};
    std::vector<Step> steps_{};
};

// Binders keyed by (statement text, target type). Each pair is compiled at
// most once; a failed compilation is retried by the next caller.
class CompiledBinderCache final {
public:
    explicit CompiledBinderCache(core::ChainTelemetry* telemetry = nullptr) noexcept : telemetry_{telemetry} {}

    [[nodiscard]] std::shared_ptr<const CompiledBinder> get_or_compile(std::string_view command_text,
                                                                       const execution::RowCursor& cursor,
                                                                       const model::TypeDescriptor& type);

    [[nodiscard]] std::size_t size() const { return binders_.size(); }
    [[nodiscard]] std::uint64_t compilations() const { return binders_.stats().misses; }
    void clear() { binders_.clear(); }

private:
    struct Key final {
        std::string command_text;
        std::type_index type;

        friend bool operator==(const Key&, const Key&) = default;
    };

    struct KeyHash final {
        [[nodiscard]] std::size_t operator()(const Key& key) const noexcept;
    };

    core::ChainTelemetry* telemetry_;
    core::LazyCache<Key, std::shared_ptr<const CompiledBinder>, KeyHash> binders_{};
};

}  // namespace sqlchain::materializer
