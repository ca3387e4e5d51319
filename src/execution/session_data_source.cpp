#include "sqlchain/execution/session_data_source.hpp"

#include "sqlchain/execution/transactional_data_source.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::execution {

SessionDataSource::SessionDataSource(std::string name,
                                     std::shared_ptr<NativeSession> session,
                                     Shared shared,
                                     DataSourceConfig config)
    : DataSource{std::move(name), std::move(shared), std::move(config)}
    , session_{std::move(session)}
{
    if (!session_) {
        throw std::invalid_argument{"SessionDataSource requires a native session"};
    }
}

std::unique_ptr<TransactionalDataSource> SessionDataSource::begin_transaction()
{
    auto connection = session_->open_connection();
    if (!connection) {
        throw std::logic_error{"Native session " + name() + " returned no connection"};
    }
    return std::make_unique<TransactionalDataSource>(name() + " (transaction)", std::move(connection), shared(),
                                                     config());
}

std::shared_ptr<NativeConnection> SessionDataSource::open_chain_connection()
{
    return session_->open_connection();
}

}  // namespace sqlchain::execution
