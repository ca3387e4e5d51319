#include "sqlchain/builder/operation_command.hpp"

#include "sqlchain/builder/sql_dialect.hpp"
#include "sqlchain/core/chain_errors.hpp"

#include <utility>

namespace sqlchain::builder {

OperationCommand::OperationCommand(execution::DataSource& source, OperationDescriptor descriptor)
    : source_{&source}
    , descriptor_{std::move(descriptor)}
    , table_{source.metadata().get_table_or_view(descriptor_.target())}
{
    if (!table_) {
        core::throw_chain_error(core::ChainErrc::MetadataNotFound,
                                "Could not find table or view " + descriptor_.target().to_string() + " on "
                                    + source.name());
    }
}

const catalog::ColumnMetadata* OperationCommand::try_get_column(std::string_view name) const noexcept
{
    return table_->try_get_column(name);
}

execution::ExecutionToken OperationCommand::prepare(const materializer::Materializer& materializer) const
{
    const auto desired = materializer.desired_columns();
    const StatementContext context{*table_, descriptor_, desired, source_->strict_mode()};
    auto token = source_->dialect().prepare(context);
    if (auto* telemetry = source_->telemetry(); telemetry != nullptr) {
        telemetry->record_statement_prepared();
    }
    return token;
}

}  // namespace sqlchain::builder
