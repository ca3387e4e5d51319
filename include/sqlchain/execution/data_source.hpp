#pragma once

#include "sqlchain/core/chain_telemetry.hpp"
#include "sqlchain/core/telemetry_registry.hpp"
#include "sqlchain/execution/execution_events.hpp"
#include "sqlchain/execution/execution_token.hpp"
#include "sqlchain/execution/native_command.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace sqlchain::builder {
class SqlDialect;
}  // namespace sqlchain::builder

namespace sqlchain::catalog {
class MetadataCache;
}  // namespace sqlchain::catalog

namespace sqlchain::materializer {
class CompiledBinderCache;
}  // namespace sqlchain::materializer

namespace sqlchain::execution {

struct DataSourceConfig final {
    // Unknown desired columns and unmatched argument values become errors.
    bool strict_mode = false;
    std::optional<std::chrono::milliseconds> default_command_timeout{};
    // Skips the per-token reader/writer lock even where the dialect asks for one.
    bool disable_locks = false;
    core::ChainTelemetry* telemetry = nullptr;
    ExecutionListener listener{};
};

// Consumes the rows of a Reader token. The returned count, when present,
// is what the token's row-count expectation is checked against.
using RowHandler = std::function<std::optional<std::int64_t>(RowCursor& cursor)>;

// Runs execution token chains against one native session or connection.
class DataSource {
public:
    struct Shared final {
        std::shared_ptr<const builder::SqlDialect> dialect{};
        std::shared_ptr<catalog::MetadataCache> metadata{};
        std::shared_ptr<materializer::CompiledBinderCache> binders{};
    };

    DataSource(std::string name, Shared shared, DataSourceConfig config);
    virtual ~DataSource();

    DataSource(const DataSource&) = delete;
    DataSource& operator=(const DataSource&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const builder::SqlDialect& dialect() const noexcept { return *shared_.dialect; }
    [[nodiscard]] catalog::MetadataCache& metadata() const noexcept { return *shared_.metadata; }
    [[nodiscard]] materializer::CompiledBinderCache& binder_cache() const noexcept { return *shared_.binders; }
    [[nodiscard]] const DataSourceConfig& config() const noexcept { return config_; }
    [[nodiscard]] bool strict_mode() const noexcept { return config_.strict_mode; }
    [[nodiscard]] core::ChainTelemetry* telemetry() const noexcept { return config_.telemetry; }

    // Runs every token of the chain in order. Native failures propagate
    // unchanged; a failed row-count check stops the chain. Returns the count
    // reported by the last write of the chain, or by the last statement when
    // the chain only reads.
    std::optional<std::int64_t> execute(const ExecutionToken& token, const RowHandler& handler);

    // Runs the chain on a worker thread. A failure after `stop` was requested
    // surfaces as ChainErrc::OperationCanceled. The data source must outlive
    // the returned future.
    [[nodiscard]] std::future<std::optional<std::int64_t>> execute_async(ExecutionToken token,
                                                                          RowHandler handler,
                                                                          std::stop_token stop = {});

    // Publishes this source's telemetry under `identifier` until destruction.
    void register_telemetry(core::TelemetryRegistry& registry, std::string identifier);

protected:
    [[nodiscard]] const Shared& shared() const noexcept { return shared_; }

    // Connection every statement of one chain runs on, so statements that
    // read connection state (LAST_INSERT_ID, SCOPE_IDENTITY) see their writes.
    [[nodiscard]] virtual std::shared_ptr<NativeConnection> open_chain_connection() = 0;
    // Throws when the source can no longer run statements.
    virtual void check_usable() const {}
    // Guards token execution; nullptr when the source needs no locking.
    [[nodiscard]] virtual std::shared_mutex* token_mutex() noexcept { return nullptr; }

private:
    [[nodiscard]] std::optional<std::int64_t> run_chain(const ExecutionToken& token,
                                                        const RowHandler& handler,
                                                        const std::stop_token* stop);
    [[nodiscard]] std::optional<std::int64_t> run_token(NativeConnection& connection,
                                                        const ExecutionToken& token,
                                                        const RowHandler& handler,
                                                        const std::stop_token* stop);
    void emit(const ExecutionEvent& event) const;

    std::string name_;
    Shared shared_;
    DataSourceConfig config_;
    core::TelemetryRegistry* registry_ = nullptr;
    std::string registry_identifier_{};
};

}  // namespace sqlchain::execution
