#include "sqlchain/builder/postgresql_dialect.hpp"
#include "sqlchain/builder/sqlserver_dialect.hpp"
#include "sqlchain/catalog/metadata_cache.hpp"
#include "sqlchain/catalog/postgresql_metadata_cache.hpp"
#include "sqlchain/catalog/sqlserver_metadata_cache.hpp"
#include "sqlchain/catalog/table_metadata.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/core/chain_telemetry.hpp"

#include "support/scripted_session.hpp"
#include "support/test_models.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace sqlchain;
using namespace sqlchain::catalog;
using sqlchain::core::ValueKind;
using sqlchain::tests::ScriptedSession;

namespace {

[[nodiscard]] std::vector<std::string> mapped_columns(const ColumnPropertyMapList& maps)
{
    std::vector<std::string> names;
    for (const auto& entry : *maps) {
        names.push_back(entry.column->sql_name());
    }
    return names;
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

[[nodiscard]] tests::ScriptedResult employee_object_row()
{
    return tests::result_set({"SchemaName", "Name", "IsTable", "ObjectId"},
                             {ValueKind::String, ValueKind::String, ValueKind::Boolean, ValueKind::Int32},
                             {{core::Value{"HR"}, core::Value{"Employee"}, core::Value{true},
                               core::Value{std::int32_t{901}}}});
}

[[nodiscard]] tests::ScriptedResult employee_column_rows()
{
    const std::vector<ValueKind> kinds{ValueKind::String,  ValueKind::String,  ValueKind::Boolean,
                                       ValueKind::Boolean, ValueKind::Boolean, ValueKind::Boolean};
    auto row = [](const char* name, const char* type, bool nullable, bool identity, bool computed, bool key) {
        return std::vector<core::Value>{core::Value{name},     core::Value{type},     core::Value{nullable},
                                        core::Value{identity}, core::Value{computed}, core::Value{key}};
    };
    return tests::result_set({"ColumnName", "TypeName", "IsNullable", "IsIdentity", "IsComputed", "IsPrimaryKey"},
                             kinds,
                             {row("EmployeeKey", "int", false, true, false, true),
                              row("FirstName", "nvarchar", false, false, false, false),
                              row("LastName", "nvarchar", false, false, false, false),
                              row("Salary", "money", true, false, false, false),
                              row("FullName", "nvarchar", true, false, true, false)});
}

void script_employee_discovery(ScriptedSession& session)
{
    session.on("o.type IN ('U', 'V')", employee_object_row());
    session.on("FROM sys.columns", employee_column_rows());
}

}  // namespace

TEST_CASE("ColumnMetadata derives property names and updatability")
{
    auto definition = tests::column("First Name", "nvarchar(50)", ValueKind::String);
    const ColumnMetadata column{definition, "[First Name]"};
    CHECK(column.sql_name() == "First Name");
    CHECK(column.quoted_sql_name() == "[First Name]");
    CHECK(column.property_name() == "FirstName");
    CHECK(column.is_updatable());

    const ColumnMetadata identity{tests::identity_key("Id", "int", ValueKind::Int32), "[Id]"};
    CHECK_FALSE(identity.is_updatable());
    CHECK(identity.is_primary_key());
}

TEST_CASE("TableOrViewMetadata finds columns by SQL or property name")
{
    const builder::SqlServerDialect dialect;
    const auto table = tests::make_table(dialect, ObjectName{"dbo", "Person"}, true,
                                         {tests::column("First Name", "nvarchar", ValueKind::String),
                                          tests::column("Age", "int", ValueKind::Int32)});
    REQUIRE(table->try_get_column("first name") != nullptr);
    CHECK(table->try_get_column("FirstName") == table->try_get_column("First Name"));
    CHECK(table->try_get_column("age")->value_kind() == ValueKind::Int32);
    CHECK(table->try_get_column("Missing") == nullptr);
    CHECK(table->quoted_name() == "[dbo].[Person]");
}

TEST_CASE("TableOrViewMetadata rejects duplicate columns")
{
    const builder::SqlServerDialect dialect;
    CHECK_THROWS_AS(tests::make_table(dialect, ObjectName{"dbo", "Dup"}, true,
                                      {tests::column("Name", "nvarchar", ValueKind::String),
                                       tests::column("NAME", "nvarchar", ValueKind::String)}),
                    std::invalid_argument);
}

TEST_CASE("properties_for computes each type and filter once")
{
    const builder::SqlServerDialect dialect;
    const auto table = tests::employee_table(dialect);
    const auto& type = model::type_descriptor<tests::Employee>();

    const auto first = table->properties_for(type, PropertiesFilter::None);
    const auto second = table->properties_for(type, PropertiesFilter::None);
    CHECK(first.get() == second.get());
    CHECK(table->property_map_computations() == 1U);

    (void)table->properties_for(type, PropertiesFilter::PrimaryKey);
    CHECK(table->property_map_computations() == 2U);
}

TEST_CASE("properties_for joins only mapped, direct properties")
{
    const builder::SqlServerDialect dialect;
    const auto table = tests::employee_table(dialect);
    const auto& type = model::type_descriptor<tests::Employee>();

    CHECK(mapped_columns(table->properties_for(type, PropertiesFilter::None))
          == std::vector<std::string>{"EmployeeKey", "FirstName", "MiddleName", "LastName", "Title", "ManagerKey"});
    CHECK(mapped_columns(table->properties_for(type, PropertiesFilter::PrimaryKey))
          == std::vector<std::string>{"EmployeeKey"});
    CHECK(mapped_columns(table->properties_for(type, PropertiesFilter::NonPrimaryKey))
          == std::vector<std::string>{"FirstName", "MiddleName", "LastName", "Title", "ManagerKey"});
    CHECK(mapped_columns(table->properties_for(type, PropertiesFilter::UpdatableOnly))
          == std::vector<std::string>{"FirstName", "MiddleName", "LastName", "Title", "ManagerKey"});
}

TEST_CASE("properties_for honours object-defined keys and column overrides")
{
    const builder::SqlServerDialect dialect;
    const auto table = tests::employee_table(dialect);
    const auto& type = model::type_descriptor<tests::EmployeeByName>();

    CHECK(mapped_columns(table->properties_for(type, PropertiesFilter::ObjectDefinedKey))
          == std::vector<std::string>{"FirstName", "LastName"});

    const auto non_key = table->properties_for(type, PropertiesFilter::ObjectDefinedNonKey);
    REQUIRE(non_key->size() == 1U);
    CHECK(non_key->front().column->sql_name() == "Title");
    CHECK(non_key->front().property->name() == "JobTitle");
}

TEST_CASE("properties_for joins column overrides by SQL name")
{
    const builder::SqlServerDialect dialect;
    const auto table = tests::make_table(dialect, ObjectName{"dbo", "People"}, true,
                                         {tests::identity_key("Id", "int", ValueKind::Int32),
                                          tests::column("First Name", "nvarchar(50)", ValueKind::String, false)});
    const auto& type = model::type_descriptor<tests::Person>();

    const auto all = table->properties_for(type, PropertiesFilter::None);
    CHECK(mapped_columns(all) == std::vector<std::string>{"Id", "First Name"});
    CHECK(all->back().property->name() == "First");

    const auto strict = table->properties_for(type, PropertiesFilter::NonPrimaryKey
                                                        | PropertiesFilter::ThrowOnMissingColumns);
    CHECK(mapped_columns(strict) == std::vector<std::string>{"First Name"});
}

TEST_CASE("properties_for raises MappingFailed for the throw flags")
{
    const builder::SqlServerDialect dialect;
    const auto table = tests::employee_table(dialect);

    SECTION("no matching properties")
    {
        CHECK(chain_error_of([&] {
                  (void)table->properties_for(model::type_descriptor<tests::Widget>(),
                                              PropertiesFilter::PrimaryKey | PropertiesFilter::ThrowOnNoMatch);
              })
              == core::ChainErrc::MappingFailed);
    }

    SECTION("primary key column without a property")
    {
        CHECK(chain_error_of([&] {
                  (void)table->properties_for(model::type_descriptor<tests::EmployeeByName>(),
                                              PropertiesFilter::PrimaryKey
                                                  | PropertiesFilter::ThrowOnMissingProperties);
              })
              == core::ChainErrc::MappingFailed);
    }

    SECTION("mapped property without a column")
    {
        CHECK(chain_error_of([&] {
                  (void)table->properties_for(model::type_descriptor<tests::WidgetName>(),
                                              PropertiesFilter::ThrowOnMissingColumns);
              })
              == core::ChainErrc::MappingFailed);
    }

    SECTION("failures are not cached")
    {
        const auto filter = PropertiesFilter::PrimaryKey | PropertiesFilter::ThrowOnNoMatch;
        const auto& widget = model::type_descriptor<tests::Widget>();
        CHECK_THROWS_AS(table->properties_for(widget, filter), std::system_error);
        CHECK_THROWS_AS(table->properties_for(widget, filter), std::system_error);
        CHECK(table->property_map_computations() == 2U);
    }
}

TEST_CASE("MetadataCache requires a session")
{
    const builder::SqlServerDialect dialect;
    CHECK_THROWS_AS(tests::FixedMetadataCache(dialect, MetadataCache::Config{}), std::invalid_argument);
}

TEST_CASE("MetadataCache discovers a name once across concurrent callers")
{
    const builder::SqlServerDialect dialect;
    core::ChainTelemetry telemetry;
    tests::FixedMetadataCache cache{dialect, {std::make_shared<ScriptedSession>(), &telemetry, std::nullopt}};
    cache.add(tests::make_table(dialect, ObjectName{"dbo", "Widget"}, true,
                                {tests::column("Id", "bigint", ValueKind::Int64, false)}));
    cache.set_discovery_delay(std::chrono::milliseconds{25});

    const std::vector<std::string> spellings{"Widget", "dbo.Widget", "[DBO].[widget]", "WIDGET"};
    std::vector<MetadataCache::TablePtr> seen(16);
    std::vector<std::thread> workers;
    for (std::size_t index = 0U; index < seen.size(); ++index) {
        workers.emplace_back([&, index] { seen[index] = cache.get_table_or_view(spellings[index % spellings.size()]); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(cache.discover_calls() == 1U);
    CHECK(cache.discovery_count() == 1U);
    for (const auto& table : seen) {
        REQUIRE(table != nullptr);
        CHECK(table.get() == seen.front().get());
    }
    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.metadata_discoveries == 1U);
    CHECK(snapshot.metadata_not_found == 0U);
    CHECK(snapshot.discovery_latency.invocations == 1U);
}

TEST_CASE("MetadataCache raises MetadataNotFound for unknown names")
{
    const builder::SqlServerDialect dialect;
    core::ChainTelemetry telemetry;
    tests::FixedMetadataCache cache{dialect, {std::make_shared<ScriptedSession>(), &telemetry, std::nullopt}};

    CHECK(chain_error_of([&] { (void)cache.get_table_or_view("dbo.Missing"); }) == core::ChainErrc::MetadataNotFound);
    CHECK(chain_error_of([&] { (void)cache.get_table_or_view("Missing"); }) == core::ChainErrc::MetadataNotFound);
    CHECK(cache.discover_calls() == 2U);
    CHECK(telemetry.snapshot().metadata_not_found == 2U);
    CHECK(cache.cached_tables_and_views().empty());
}

TEST_CASE("MetadataCache preloads every listed table")
{
    const builder::SqlServerDialect dialect;
    tests::FixedMetadataCache cache{dialect, {std::make_shared<ScriptedSession>(), nullptr, std::nullopt}};
    cache.add(tests::employee_table(dialect, true));
    cache.add(tests::employee_table(dialect, false));

    cache.preload_tables();
    auto cached = cache.cached_tables_and_views();
    REQUIRE(cached.size() == 1U);
    CHECK(cached.front()->is_table());

    cache.preload_views();
    CHECK(cache.cached_tables_and_views().size() == 2U);

    (void)cache.get_table_or_view(ObjectName{"hr", "employeeview"});
    CHECK(cache.discover_calls() == 2U);
}

TEST_CASE("SqlServerMetadataCache reads the system catalog once per table")
{
    const builder::SqlServerDialect dialect;
    auto session = std::make_shared<ScriptedSession>();
    script_employee_discovery(*session);
    session->set_latency(std::chrono::milliseconds{10});

    SqlServerMetadataCache cache{dialect, {session, nullptr, std::chrono::milliseconds{5000}}};

    std::vector<std::thread> workers;
    for (int index = 0; index < 8; ++index) {
        workers.emplace_back([&] { (void)cache.get_table_or_view("HR.Employee"); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(session->count_matching("FROM sys.objects") == 1U);
    CHECK(session->count_matching("FROM sys.columns") == 1U);

    const auto table = cache.get_table_or_view(ObjectName{"hr", "EMPLOYEE"});
    REQUIRE(table != nullptr);
    CHECK(table->name().to_string() == "HR.Employee");
    CHECK(table->quoted_name() == "[HR].[Employee]");
    CHECK(table->is_table());
    REQUIRE(table->columns().size() == 5U);

    const auto* key = table->try_get_column("EmployeeKey");
    REQUIRE(key != nullptr);
    CHECK(key->is_primary_key());
    CHECK(key->is_identity());
    CHECK(key->value_kind() == ValueKind::Int32);
    CHECK(table->try_get_column("Salary")->value_kind() == ValueKind::Double);
    CHECK(table->try_get_column("FullName")->is_computed());
    CHECK_FALSE(table->try_get_column("FirstName")->is_nullable());

    const auto requests = session->executed();
    REQUIRE_FALSE(requests.empty());
    CHECK(requests.front().timeout == std::chrono::milliseconds{5000});
    const auto& parameters = requests.front().parameters;
    REQUIRE(parameters.size() == 2U);
    CHECK(parameters[0].name == "@Schema");
    CHECK(parameters[0].value.as_string() == "HR");
    CHECK(parameters[1].value.as_string() == "Employee");
}

TEST_CASE("SqlServerMetadataCache fills in the default schema")
{
    const builder::SqlServerDialect dialect;
    auto session = std::make_shared<ScriptedSession>();
    session->on("o.type IN ('U', 'V')", tests::result_set({"SchemaName", "Name", "IsTable", "ObjectId"},
                                                          {ValueKind::String, ValueKind::String, ValueKind::Boolean,
                                                           ValueKind::Int32},
                                                          {}));

    SqlServerMetadataCache cache{dialect, {session, nullptr, std::nullopt}};
    CHECK(chain_error_of([&] { (void)cache.get_table_or_view("Orders"); }) == core::ChainErrc::MetadataNotFound);

    const auto requests = session->executed();
    REQUIRE(requests.size() == 1U);
    CHECK(requests.front().parameters[0].value.as_string() == "dbo");
    CHECK(requests.front().parameters[1].value.as_string() == "Orders");
}

TEST_CASE("SqlServerMetadataCache preloads from the object list")
{
    const builder::SqlServerDialect dialect;
    auto session = std::make_shared<ScriptedSession>();
    script_employee_discovery(*session);
    session->on("o.type = @Type",
                tests::result_set({"SchemaName", "Name"}, {ValueKind::String, ValueKind::String},
                                  {{core::Value{"HR"}, core::Value{"Employee"}}}));

    SqlServerMetadataCache cache{dialect, {session, nullptr, std::nullopt}};
    cache.preload_tables();
    CHECK(cache.cached_tables_and_views().size() == 1U);

    (void)cache.get_table_or_view("HR.Employee");
    CHECK(session->count_matching("FROM sys.columns") == 1U);

    const auto requests = session->executed();
    CHECK(requests.front().parameters.front().value.as_string() == "U");
}

TEST_CASE("Stored procedure metadata comes from sys.parameters")
{
    const builder::SqlServerDialect dialect;
    auto session = std::make_shared<ScriptedSession>();
    session->on("o.type = 'P'", tests::result_set({"SchemaName", "Name", "ObjectId"},
                                                  {ValueKind::String, ValueKind::String, ValueKind::Int64},
                                                  {{core::Value{"dbo"}, core::Value{"GetTotals"},
                                                    core::Value{std::int64_t{77}}}}));
    session->on("sys.parameters",
                tests::result_set({"ParameterName", "TypeName", "IsOutput"},
                                  {ValueKind::String, ValueKind::String, ValueKind::Boolean},
                                  {{core::Value{"@Id"}, core::Value{"int"}, core::Value{false}},
                                   {core::Value{"@Total"}, core::Value{"money"}, core::Value{true}}}));

    SqlServerMetadataCache cache{dialect, {session, nullptr, std::nullopt}};
    const auto procedure = cache.get_stored_procedure(ObjectName{"", "GetTotals"});
    REQUIRE(procedure != nullptr);
    CHECK(procedure->quoted_name() == "[dbo].[GetTotals]");
    REQUIRE(procedure->parameters().size() == 2U);
    CHECK(procedure->parameters()[0].sql_name == "@Id");
    CHECK(procedure->parameters()[0].value_kind == ValueKind::Int32);
    CHECK_FALSE(procedure->parameters()[0].is_output);
    CHECK(procedure->parameters()[1].value_kind == ValueKind::Double);
    CHECK(procedure->parameters()[1].is_output);

    (void)cache.get_stored_procedure(ObjectName{"dbo", "gettotals"});
    CHECK(session->count_matching("sys.parameters") == 1U);
}

TEST_CASE("Dialects without procedure discovery return no procedure")
{
    const builder::PostgreSqlDialect dialect;
    auto session = std::make_shared<ScriptedSession>();
    PostgreSqlMetadataCache cache{dialect, {session, nullptr, std::nullopt}};

    CHECK(cache.get_stored_procedure(ObjectName{"public", "refresh_totals"}) == nullptr);
    CHECK(session->executed().empty());
}
