#include "sqlchain/builder/sqlserver_dialect.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/chain_telemetry.hpp"
#include "sqlchain/core/telemetry_registry.hpp"
#include "sqlchain/execution/data_source_factory.hpp"
#include "sqlchain/execution/session_data_source.hpp"
#include "sqlchain/execution/transactional_data_source.hpp"
#include "sqlchain/materializer/compiled_binder.hpp"

#include "support/scripted_session.hpp"
#include "support/test_models.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace sqlchain;
using namespace sqlchain::execution;
using sqlchain::core::Value;
using sqlchain::core::ValueKind;
using sqlchain::tests::ScriptedSession;

namespace {

[[nodiscard]] ExecutionToken make_token(std::string name,
                                        std::string text,
                                        ExecutionMode mode,
                                        LockMode lock = LockMode::Write,
                                        std::optional<std::int64_t> expected = std::nullopt)
{
    ExecutionToken::Spec spec{};
    spec.operation_name = std::move(name);
    spec.command_text = std::move(text);
    spec.mode = mode;
    spec.lock_mode = lock;
    spec.expected_row_count = expected;
    return ExecutionToken{std::move(spec)};
}

[[nodiscard]] core::ChainErrc chain_error_of(const std::function<void()>& action)
{
    try {
        action();
    } catch (const std::system_error& error) {
        return static_cast<core::ChainErrc>(error.code().value());
    }
    FAIL("expected a chain error");
    return core::ChainErrc::Success;
}

// Collects listener events from any thread.
class EventLog final {
public:
    [[nodiscard]] ExecutionListener listener()
    {
        return [this](const ExecutionEvent& event) {
            std::lock_guard guard{mutex_};
            events_.push_back(event);
        };
    }

    [[nodiscard]] std::vector<ExecutionEvent> events() const
    {
        std::lock_guard guard{mutex_};
        return events_;
    }

    [[nodiscard]] std::vector<ExecutionPhase> phases() const
    {
        std::vector<ExecutionPhase> phases;
        for (const auto& event : events()) {
            phases.push_back(event.phase);
        }
        return phases;
    }

private:
    mutable std::mutex mutex_{};
    std::vector<ExecutionEvent> events_{};
};

[[nodiscard]] std::unique_ptr<SessionDataSource> open_source(const std::shared_ptr<ScriptedSession>& session,
                                                             DataSourceConfig config)
{
    auto dialect = std::make_shared<const builder::SqlServerDialect>();
    auto metadata = std::make_shared<tests::FixedMetadataCache>(
        *dialect, catalog::MetadataCache::Config{session, config.telemetry, std::nullopt});
    metadata->add(tests::make_table(*dialect, catalog::ObjectName{"dbo", "Widget"}, true,
                                    {tests::identity_key("Id", "bigint", ValueKind::Int64)}));

    DataSource::Shared shared{};
    shared.dialect = std::move(dialect);
    shared.metadata = std::move(metadata);
    return std::make_unique<SessionDataSource>("main", session, std::move(shared), std::move(config));
}

[[nodiscard]] tests::ScriptedResult widget_rows(std::int64_t count)
{
    std::vector<std::vector<Value>> rows;
    for (std::int64_t id = 1; id <= count; ++id) {
        rows.push_back({Value{id}});
    }
    return tests::result_set({"Id"}, {ValueKind::Int64}, std::move(rows));
}

}  // namespace

TEST_CASE("Data sources require their collaborators")
{
    auto session = std::make_shared<ScriptedSession>();
    CHECK_THROWS_AS(SessionDataSource("main", session, DataSource::Shared{}, DataSourceConfig{}),
                    std::invalid_argument);

    auto dialect = std::make_shared<const builder::SqlServerDialect>();
    DataSource::Shared shared{};
    shared.dialect = dialect;
    shared.metadata = std::make_shared<tests::FixedMetadataCache>(*dialect,
                                                                  catalog::MetadataCache::Config{session});
    CHECK_THROWS_AS(SessionDataSource("main", nullptr, shared, DataSourceConfig{}), std::invalid_argument);

    SessionDataSource source{"main", session, shared, DataSourceConfig{}};
    CHECK(source.binder_cache().size() == 0U);
    CHECK(source.dialect().name() == "SQL Server");
}

TEST_CASE("execute runs a chain in order and reports the write count")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("SELECT", widget_rows(2));
    session->on("UPDATE", tests::affected_rows(1));
    auto source = open_source(session, DataSourceConfig{});

    auto chain = make_token("Update dbo.Widget (read back)", "SELECT [Id] FROM [dbo].[Widget] WHERE [Id] = @Id;",
                            ExecutionMode::Reader)
                     .then(make_token("Update dbo.Widget", "UPDATE [dbo].[Widget] SET [Name] = @Name;",
                                      ExecutionMode::NonQuery, LockMode::Write, 1));

    std::int64_t handled = 0;
    const auto rows = source->execute(chain, [&](RowCursor& cursor) -> std::optional<std::int64_t> {
        while (cursor.read()) {
            ++handled;
        }
        return handled;
    });

    CHECK(rows == 1);
    CHECK(handled == 2);
    CHECK(session->executed_text()
          == std::vector<std::string>{"SELECT [Id] FROM [dbo].[Widget] WHERE [Id] = @Id;",
                                      "UPDATE [dbo].[Widget] SET [Name] = @Name;"});
}

TEST_CASE("Every statement of a chain runs on one connection")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("INSERT", tests::affected_rows(1));
    session->on("LAST_INSERT_ID", widget_rows(1));
    auto source = open_source(session, DataSourceConfig{});

    auto chain = make_token("Insert dbo.Widget", "INSERT INTO `Widget` (`Name`) VALUES (@Name);",
                            ExecutionMode::NonQuery, LockMode::Write, 1)
                     .then(make_token("Insert dbo.Widget (read back)",
                                      "SELECT `Id` FROM `Widget` WHERE `Id` = LAST_INSERT_ID();",
                                      ExecutionMode::Reader));

    CHECK(source->execute(chain, {}) == 1);
    CHECK(session->connections_opened() == 1U);
    CHECK(session->executed_connections() == std::vector<std::size_t>{1U, 1U});

    CHECK(source->execute_async(chain, {}).get() == 1);
    CHECK(session->connections_opened() == 2U);
    CHECK(session->executed_connections() == std::vector<std::size_t>{1U, 1U, 2U, 2U});
}

TEST_CASE("A read-only chain reports the rows it read")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("SELECT", widget_rows(3));
    auto source = open_source(session, DataSourceConfig{});

    CHECK(source->execute(make_token("Query dbo.Widget", "SELECT [Id] FROM [dbo].[Widget];", ExecutionMode::Reader),
                          {})
          == 3);
}

TEST_CASE("A row-count mismatch stops the chain")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("DELETE", tests::affected_rows(0));
    session->on("SELECT", widget_rows(1));
    core::ChainTelemetry telemetry;
    EventLog log;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    config.listener = log.listener();
    auto source = open_source(session, std::move(config));

    const auto chain = make_token("Delete dbo.Widget", "DELETE FROM [dbo].[Widget] WHERE [Id] = @Id;",
                                  ExecutionMode::NonQuery, LockMode::Write, 1)
                           .then(make_token("Delete dbo.Widget (read back)", "SELECT [Id] FROM [dbo].[Widget];",
                                            ExecutionMode::Reader));

    CHECK(chain_error_of([&] { (void)source->execute(chain, {}); }) == core::ChainErrc::RowCountMismatch);
    CHECK(session->count_matching("SELECT") == 0U);

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.row_count_mismatches == 1U);
    CHECK(snapshot.executions_failed == 1U);
    CHECK(snapshot.executions_succeeded == 0U);
    CHECK(log.phases() == std::vector<ExecutionPhase>{ExecutionPhase::Started, ExecutionPhase::Failed});
    CHECK(log.events().back().error.find("Delete dbo.Widget") != std::string::npos);
}

TEST_CASE("Native failures propagate unchanged")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("UPDATE", tests::native_failure("deadlock victim"));
    core::ChainTelemetry telemetry;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    auto source = open_source(session, std::move(config));

    CHECK_THROWS_WITH(source->execute(make_token("Update", "UPDATE [dbo].[Widget] SET [Id] = 1;",
                                                 ExecutionMode::NonQuery),
                                      {}),
                      "deadlock victim");
    CHECK(telemetry.snapshot().executions_failed == 1U);
    CHECK(telemetry.snapshot().row_count_mismatches == 0U);
}

TEST_CASE("Listeners see started and finished events")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("INSERT", tests::affected_rows(1));
    core::ChainTelemetry telemetry;
    EventLog log;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    config.listener = log.listener();
    config.default_command_timeout = std::chrono::milliseconds{2500};
    auto source = open_source(session, std::move(config));

    ExecutionToken::Spec spec{};
    spec.operation_name = "Insert dbo.Widget";
    spec.command_text = "INSERT INTO [dbo].[Widget] ([Name]) VALUES (@Name);";
    spec.mode = ExecutionMode::NonQuery;
    spec.parameters.push_back(SqlParameter{"@Name", Value{"secret"}, std::nullopt});
    (void)source->execute(ExecutionToken{std::move(spec)}, {});

    const auto events = log.events();
    REQUIRE(events.size() == 2U);
    CHECK(events[0].phase == ExecutionPhase::Started);
    CHECK(events[1].phase == ExecutionPhase::Finished);
    CHECK(events[1].data_source == "main");
    CHECK(events[1].rows_affected == 1);
    CHECK(events[1].parameter_names == std::vector<std::string>{"@Name"});
    CHECK(format_execution_event_json(events[1]).find("secret") == std::string::npos);

    REQUIRE(session->executed().size() == 1U);
    CHECK(session->executed().front().timeout == std::chrono::milliseconds{2500});

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.executions_started == 1U);
    CHECK(snapshot.executions_succeeded == 1U);
    CHECK(snapshot.execution_latency.invocations == 1U);
    CHECK(snapshot.write_lock_acquisitions == 0U);
}

TEST_CASE("A stop request before the chain starts cancels it")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("UPDATE", tests::affected_rows(1));
    core::ChainTelemetry telemetry;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    auto source = open_source(session, std::move(config));

    std::stop_source stop;
    stop.request_stop();
    auto future = source->execute_async(make_token("Update", "UPDATE [dbo].[Widget] SET [Id] = 1;",
                                                   ExecutionMode::NonQuery),
                                        {}, stop.get_token());

    CHECK(chain_error_of([&] { (void)future.get(); }) == core::ChainErrc::OperationCanceled);
    CHECK(session->executed().empty());
    CHECK(telemetry.snapshot().executions_canceled == 1U);
}

TEST_CASE("A stop request during execution surfaces as OperationCanceled")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("UPDATE", tests::affected_rows(1));
    session->set_latency(std::chrono::milliseconds{2000});
    core::ChainTelemetry telemetry;
    EventLog log;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    config.listener = log.listener();
    auto source = open_source(session, std::move(config));

    std::stop_source stop;
    auto future = source->execute_async(make_token("Update", "UPDATE [dbo].[Widget] SET [Id] = 1;",
                                                   ExecutionMode::NonQuery),
                                        {}, stop.get_token());
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    stop.request_stop();

    CHECK(chain_error_of([&] { (void)future.get(); }) == core::ChainErrc::OperationCanceled);
    CHECK(telemetry.snapshot().executions_canceled == 1U);
    CHECK(telemetry.snapshot().executions_failed == 0U);
    CHECK(log.phases() == std::vector<ExecutionPhase>{ExecutionPhase::Started, ExecutionPhase::Canceled});
    CHECK(log.events().back().error.find("aborted") != std::string::npos);
}

TEST_CASE("Transactions run write tokens one at a time")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("UPDATE", tests::affected_rows(1));
    session->set_latency(std::chrono::milliseconds{20});
    core::ChainTelemetry telemetry;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    auto source = open_source(session, std::move(config));

    auto transaction = source->begin_transaction();
    CHECK(session->connections_opened() == 1U);
    CHECK(transaction->name() == "main (transaction)");
    CHECK(&transaction->binder_cache() == &source->binder_cache());

    const auto token = make_token("Update", "UPDATE [dbo].[Widget] SET [Id] = 1;", ExecutionMode::NonQuery,
                                  LockMode::Write, 1);
    std::vector<std::optional<std::int64_t>> counts(4);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        workers.emplace_back([&, i] { counts[i] = transaction->execute(token, {}); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& count : counts) {
        CHECK(count == 1);
    }
    CHECK(session->max_concurrent_commands() == 1U);
    CHECK(telemetry.snapshot().write_lock_acquisitions == 4U);
    CHECK(session->connections_opened() == 1U);

    transaction->commit();
    CHECK(transaction->completed());
    CHECK(session->commits() == 1U);
    CHECK(chain_error_of([&] { (void)transaction->execute(token, {}); }) == core::ChainErrc::ObjectDisposed);
    CHECK(chain_error_of([&] { transaction->commit(); }) == core::ChainErrc::ObjectDisposed);
    CHECK(chain_error_of([&] { transaction->rollback(); }) == core::ChainErrc::ObjectDisposed);
}

TEST_CASE("Read tokens share the transaction lock")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("SELECT", widget_rows(1));
    core::ChainTelemetry telemetry;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    auto source = open_source(session, std::move(config));
    auto transaction = source->begin_transaction();

    const auto token = make_token("Query", "SELECT [Id] FROM [dbo].[Widget];", ExecutionMode::Reader, LockMode::Read);
    (void)transaction->execute(token, {});
    (void)transaction->execute(make_token("Unlocked", "SELECT 1;", ExecutionMode::Reader, LockMode::None), {});

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.read_lock_acquisitions == 1U);
    CHECK(snapshot.write_lock_acquisitions == 0U);
}

TEST_CASE("disable_locks skips the transaction lock")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("UPDATE", tests::affected_rows(1));
    core::ChainTelemetry telemetry;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    config.disable_locks = true;
    auto source = open_source(session, std::move(config));
    auto transaction = source->begin_transaction();

    (void)transaction->execute(make_token("Update", "UPDATE [dbo].[Widget] SET [Id] = 1;", ExecutionMode::NonQuery),
                               {});
    CHECK(telemetry.snapshot().write_lock_acquisitions == 0U);
    transaction->rollback();
    CHECK(session->rollbacks() == 1U);
}

TEST_CASE("An abandoned transaction rolls back")
{
    auto session = std::make_shared<ScriptedSession>();
    core::ChainTelemetry telemetry;
    DataSourceConfig config{};
    config.telemetry = &telemetry;
    auto source = open_source(session, std::move(config));

    {
        auto transaction = source->begin_transaction();
    }
    CHECK(session->rollbacks() == 1U);
    CHECK(session->commits() == 0U);

    session->fail_rollback(true);
    CHECK_NOTHROW([&] { auto transaction = source->begin_transaction(); }());
    CHECK(session->rollbacks() == 1U);
    CHECK(telemetry.snapshot().rollback_failures == 1U);
}

TEST_CASE("Committed transactions are not rolled back on destruction")
{
    auto session = std::make_shared<ScriptedSession>();
    auto source = open_source(session, DataSourceConfig{});
    {
        auto transaction = source->begin_transaction();
        transaction->commit();
    }
    CHECK(session->commits() == 1U);
    CHECK(session->rollbacks() == 0U);
}

TEST_CASE("open_data_source wires the dialect and catalog")
{
    auto session = std::make_shared<ScriptedSession>();

    const auto sqlite = open_data_source(DialectKind::Sqlite, "local", session);
    CHECK(sqlite->name() == "local");
    CHECK(sqlite->dialect().name() == "SQLite");
    CHECK(sqlite->metadata().reports_absence());
    CHECK(&sqlite->metadata().dialect() == &sqlite->dialect());

    CHECK(open_data_source(DialectKind::SqlServer, "a", session)->dialect().name() == "SQL Server");
    CHECK(open_data_source(DialectKind::PostgreSql, "b", session)->dialect().name() == "PostgreSQL");
    CHECK(open_data_source(DialectKind::MySql, "c", session)->dialect().name() == "MySQL");
    CHECK(to_string(DialectKind::PostgreSql) == "postgresql");

    CHECK_THROWS_AS(open_data_source(DialectKind::Sqlite, "none", nullptr), std::invalid_argument);
}

TEST_CASE("Data sources publish telemetry through a registry")
{
    auto session = std::make_shared<ScriptedSession>();
    session->on("UPDATE", tests::affected_rows(2));
    core::TelemetryRegistry registry;
    core::ChainTelemetry telemetry;

    {
        DataSourceConfig config{};
        config.telemetry = &telemetry;
        auto source = open_source(session, std::move(config));
        source->register_telemetry(registry, "main");
        CHECK(registry.size() == 1U);

        (void)source->execute(make_token("Update", "UPDATE [dbo].[Widget] SET [Id] = 1;", ExecutionMode::NonQuery),
                              {});
        CHECK(registry.aggregate().executions_succeeded == 1U);
    }
    CHECK(registry.size() == 0U);

    auto untracked = open_source(session, DataSourceConfig{});
    CHECK_THROWS_AS(untracked->register_telemetry(registry, "untracked"), std::invalid_argument);
}
