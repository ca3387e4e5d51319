#pragma once

#include "sqlchain/execution/data_source.hpp"

#include <memory>
#include <string>

namespace sqlchain::execution {

class TransactionalDataSource;

// Opens a connection from the shared session for each chain it runs.
class SessionDataSource final : public DataSource {
public:
    SessionDataSource(std::string name,
                      std::shared_ptr<NativeSession> session,
                      Shared shared,
                      DataSourceConfig config);

    [[nodiscard]] NativeSession& session() const noexcept { return *session_; }

    // Opens a dedicated connection and starts a transaction on it. The new
    // source shares this source's dialect, metadata and binder cache.
    [[nodiscard]] std::unique_ptr<TransactionalDataSource> begin_transaction();

protected:
    [[nodiscard]] std::shared_ptr<NativeConnection> open_chain_connection() override;

private:
    std::shared_ptr<NativeSession> session_;
};

}  // namespace sqlchain::execution
