#include "sqlchain/execution/transactional_data_source.hpp"

#include "sqlchain/core/chain_errors.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace sqlchain::execution {

TransactionalDataSource::TransactionalDataSource(std::string name,
                                                 std::unique_ptr<NativeConnection> connection,
                                                 Shared shared,
                                                 DataSourceConfig config)
    : DataSource{std::move(name), std::move(shared), std::move(config)}
    , connection_{std::move(connection)}
{
    if (!connection_) {
        throw std::invalid_argument{"TransactionalDataSource requires a native connection"};
    }
    transaction_ = connection_->begin_transaction();
    if (!transaction_) {
        throw std::logic_error{"Native connection for " + this->name() + " did not start a transaction"};
    }
}

TransactionalDataSource::~TransactionalDataSource()
{
    if (completed()) {
        return;
    }
    try {
        rollback();
    } catch (const std::exception&) {
        if (telemetry() != nullptr) {
            telemetry()->record_rollback_failure();
        }
    }
}

void TransactionalDataSource::commit()
{
    std::unique_lock guard{mutex_};
    check_usable();
    transaction_->commit();
    completed_.store(true, std::memory_order_release);
}

void TransactionalDataSource::rollback()
{
    std::unique_lock guard{mutex_};
    check_usable();
    completed_.store(true, std::memory_order_release);
    transaction_->rollback();
}

void TransactionalDataSource::check_usable() const
{
    if (completed()) {
        core::throw_chain_error(core::ChainErrc::ObjectDisposed,
                                "The transaction on " + name() + " has already been committed or rolled back");
    }
}

}  // namespace sqlchain::execution
