#pragma once

#include "sqlchain/execution/data_source.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>

namespace sqlchain::execution {

// A data source bound to one connection and one open transaction. Tokens
// asking for a Read lock run concurrently; Write tokens run alone. Once
// committed or rolled back every further call raises ChainErrc::ObjectDisposed.
class TransactionalDataSource final : public DataSource {
public:
    TransactionalDataSource(std::string name,
                            std::unique_ptr<NativeConnection> connection,
                            Shared shared,
                            DataSourceConfig config);
    // Rolls back a transaction that was never completed.
    ~TransactionalDataSource() override;

    void commit();
    void rollback();

    [[nodiscard]] bool completed() const noexcept { return completed_.load(std::memory_order_acquire); }

protected:
    [[nodiscard]] std::shared_ptr<NativeConnection> open_chain_connection() override { return connection_; }
    void check_usable() const override;
    [[nodiscard]] std::shared_mutex* token_mutex() noexcept override { return &mutex_; }

private:
    std::shared_ptr<NativeConnection> connection_;
    std::unique_ptr<NativeTransaction> transaction_;
    std::shared_mutex mutex_{};
    std::atomic<bool> completed_{false};
};

}  // namespace sqlchain::execution
