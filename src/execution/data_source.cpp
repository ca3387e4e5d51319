#include "sqlchain/execution/data_source.hpp"

#include "sqlchain/builder/sql_dialect.hpp"
#include "sqlchain/catalog/metadata_cache.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/materializer/compiled_binder.hpp"

#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace sqlchain::execution {

namespace {

[[nodiscard]] std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point since) noexcept
{
    const auto elapsed = std::chrono::steady_clock::now() - since;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

}  // namespace

DataSource::DataSource(std::string name, Shared shared, DataSourceConfig config)
    : name_{std::move(name)}
    , shared_{std::move(shared)}
    , config_{std::move(config)}
{
    if (!shared_.dialect || !shared_.metadata) {
        throw std::invalid_argument{"DataSource requires a dialect and a metadata cache"};
    }
    if (!shared_.binders) {
        shared_.binders = std::make_shared<materializer::CompiledBinderCache>(config_.telemetry);
    }
}

DataSource::~DataSource()
{
    if (registry_ != nullptr) {
        registry_->unregister_sampler(registry_identifier_);
    }
}

std::optional<std::int64_t> DataSource::execute(const ExecutionToken& token, const RowHandler& handler)
{
    return run_chain(token, handler, nullptr);
}

std::future<std::optional<std::int64_t>> DataSource::execute_async(ExecutionToken token,
                                                                   RowHandler handler,
                                                                   std::stop_token stop)
{
    return std::async(std::launch::async,
                      [this, token = std::move(token), handler = std::move(handler), stop = std::move(stop)]() {
                          return run_chain(token, handler, &stop);
                      });
}

void DataSource::register_telemetry(core::TelemetryRegistry& registry, std::string identifier)
{
    if (config_.telemetry == nullptr) {
        throw std::invalid_argument{"DataSource " + name_ + " has no telemetry to register"};
    }
    if (registry_ != nullptr) {
        registry_->unregister_sampler(registry_identifier_);
    }
    auto* telemetry = config_.telemetry;
    registry.register_sampler(identifier, [telemetry] { return telemetry->snapshot(); });
    registry_ = &registry;
    registry_identifier_ = std::move(identifier);
}

std::optional<std::int64_t> DataSource::run_chain(const ExecutionToken& token,
                                                  const RowHandler& handler,
                                                  const std::stop_token* stop)
{
    const auto connection = open_chain_connection();
    if (!connection) {
        throw std::logic_error{"DataSource " + name_ + " has no connection to run " + token.operation_name()};
    }

    std::optional<std::int64_t> result;
    bool wrote = false;
    for (const auto* current = &token; current != nullptr; current = current->next()) {
        if (stop != nullptr && stop->stop_requested()) {
            if (config_.telemetry != nullptr) {
                config_.telemetry->record_execution_canceled();
            }
            core::throw_chain_error(core::ChainErrc::OperationCanceled,
                                    current->operation_name() + " was canceled before it started");
        }
        auto rows = run_token(*connection, *current, handler, stop);
        if (!current->reads_rows()) {
            result = rows;
            wrote = true;
        } else if (!wrote) {
            result = rows;
        }
    }
    return result;
}

std::optional<std::int64_t> DataSource::run_token(NativeConnection& connection,
                                                  const ExecutionToken& token,
                                                  const RowHandler& handler,
                                                  const std::stop_token* stop)
{
    std::shared_lock<std::shared_mutex> shared_lock;
    std::unique_lock<std::shared_mutex> exclusive_lock;
    auto* mutex = token_mutex();
    if (mutex != nullptr && !config_.disable_locks && token.lock_mode() != LockMode::None) {
        const auto wait_started = std::chrono::steady_clock::now();
        const bool exclusive = token.lock_mode() == LockMode::Write;
        if (exclusive) {
            exclusive_lock = std::unique_lock{*mutex};
        } else {
            shared_lock = std::shared_lock{*mutex};
        }
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_lock_acquired(exclusive, elapsed_ns(wait_started));
        }
    }

    check_usable();

    auto* telemetry = config_.telemetry;
    const auto started_at = std::chrono::system_clock::now();
    emit(make_execution_event(ExecutionPhase::Started, name_, token, started_at));
    if (telemetry != nullptr) {
        telemetry->record_execution_started();
    }
    core::ChainTelemetry::LatencyScope latency{telemetry, core::ChainTelemetry::Stage::Execution};

    try {
        auto command = connection.create_command();
        const auto request = token.to_request(config_.default_command_timeout);

        std::optional<std::int64_t> rows;
        if (token.reads_rows()) {
            auto cursor = stop != nullptr ? command->execute_reader_async(request, *stop).get()
                                          : command->execute_reader(request);
            if (handler) {
                rows = handler(*cursor);
            } else {
                std::int64_t count = 0;
                while (cursor->read()) {
                    ++count;
                }
                rows = count;
            }
            if (!rows) {
                rows = cursor->records_affected();
            }
        } else {
            rows = stop != nullptr ? command->execute_non_query_async(request, *stop).get()
                                   : command->execute_non_query(request);
        }

        token.check_affected_row_count(rows);

        if (telemetry != nullptr) {
            telemetry->record_execution_succeeded();
        }
        auto finished = make_execution_event(ExecutionPhase::Finished, name_, token, started_at);
        finished.rows_affected = rows;
        emit(finished);
        return rows;
    } catch (const std::exception& error) {
        if (stop != nullptr && stop->stop_requested()) {
            if (telemetry != nullptr) {
                telemetry->record_execution_canceled();
            }
            auto canceled = make_execution_event(ExecutionPhase::Canceled, name_, token, started_at);
            canceled.error = error.what();
            emit(canceled);
            core::throw_chain_error(core::ChainErrc::OperationCanceled,
                                    token.operation_name() + " was canceled: " + error.what());
        }

        if (telemetry != nullptr) {
            const auto* system = dynamic_cast<const std::system_error*>(&error);
            if (system != nullptr && system->code() == core::ChainErrc::RowCountMismatch) {
                telemetry->record_row_count_mismatch();
            }
            telemetry->record_execution_failed();
        }
        auto failed = make_execution_event(ExecutionPhase::Failed, name_, token, started_at);
        failed.error = error.what();
        emit(failed);
        throw;
    }
}

void DataSource::emit(const ExecutionEvent& event) const
{
    if (config_.listener) {
        config_.listener(event);
    }
}

}  // namespace sqlchain::execution
