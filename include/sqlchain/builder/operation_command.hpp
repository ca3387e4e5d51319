#pragma once

#include "sqlchain/builder/operation_descriptor.hpp"
#include "sqlchain/catalog/metadata_cache.hpp"
#include "sqlchain/catalog/table_metadata.hpp"
#include "sqlchain/execution/data_source.hpp"
#include "sqlchain/execution/execution_token.hpp"
#include "sqlchain/materializer/materializer.hpp"

#include <memory>
#include <string_view>

namespace sqlchain::builder {

// An operation bound to a data source and its resolved table or view. The
// SQL is generated by prepare(), once the materializer has said which
// columns it needs.
class OperationCommand final {
public:
    OperationCommand(execution::DataSource& source, OperationDescriptor descriptor);

    [[nodiscard]] execution::DataSource& data_source() const noexcept { return *source_; }
    [[nodiscard]] const OperationDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] const catalog::TableOrViewMetadata& table() const noexcept { return *table_; }

    [[nodiscard]] const catalog::ColumnMetadata* try_get_column(std::string_view name) const noexcept;

    [[nodiscard]] execution::ExecutionToken prepare(const materializer::Materializer& materializer) const;

private:
    execution::DataSource* source_;
    OperationDescriptor descriptor_;
    catalog::MetadataCache::TablePtr table_;
};

}  // namespace sqlchain::builder
