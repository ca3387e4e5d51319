#include "sqlchain/execution/data_source_factory.hpp"

#include "sqlchain/builder/mysql_dialect.hpp"
#include "sqlchain/builder/postgresql_dialect.hpp"
#include "sqlchain/builder/sqlite_dialect.hpp"
#include "sqlchain/builder/sqlserver_dialect.hpp"
#include "sqlchain/catalog/mysql_metadata_cache.hpp"
#include "sqlchain/catalog/postgresql_metadata_cache.hpp"
#include "sqlchain/catalog/sqlite_metadata_cache.hpp"
#include "sqlchain/catalog/sqlserver_metadata_cache.hpp"
#include "sqlchain/materializer/compiled_binder.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::execution {

namespace {

template <typename Dialect, typename Cache>
[[nodiscard]] DataSource::Shared make_shared_state(const std::shared_ptr<NativeSession>& session,
                                                   const DataSourceConfig& config)
{
    auto dialect = std::make_shared<const Dialect>();
    catalog::MetadataCache::Config cache_config{};
    cache_config.session = session;
    cache_config.telemetry = config.telemetry;
    cache_config.command_timeout = config.default_command_timeout;

    DataSource::Shared shared{};
    shared.metadata = std::make_shared<Cache>(*dialect, std::move(cache_config));
    shared.dialect = std::move(dialect);
    shared.binders = std::make_shared<materializer::CompiledBinderCache>(config.telemetry);
    return shared;
}

}  // namespace

std::string_view to_string(DialectKind kind) noexcept
{
    switch (kind) {
    case DialectKind::SqlServer:
        return "sqlserver";
    case DialectKind::PostgreSql:
        return "postgresql";
    case DialectKind::Sqlite:
        return "sqlite";
    case DialectKind::MySql:
        return "mysql";
    default:
        return "unknown";
    }
}

std::unique_ptr<SessionDataSource> open_data_source(DialectKind kind,
                                                    std::string name,
                                                    std::shared_ptr<NativeSession> session,
                                                    DataSourceConfig config)
{
    if (!session) {
        throw std::invalid_argument{"open_data_source requires a native session"};
    }

    DataSource::Shared shared{};
    switch (kind) {
    case DialectKind::SqlServer:
        shared = make_shared_state<builder::SqlServerDialect, catalog::SqlServerMetadataCache>(session, config);
        break;
    case DialectKind::PostgreSql:
        shared = make_shared_state<builder::PostgreSqlDialect, catalog::PostgreSqlMetadataCache>(session, config);
        break;
    case DialectKind::Sqlite:
        shared = make_shared_state<builder::SqliteDialect, catalog::SqliteMetadataCache>(session, config);
        break;
    case DialectKind::MySql:
        shared = make_shared_state<builder::MySqlDialect, catalog::MySqlMetadataCache>(session, config);
        break;
    default:
        throw std::invalid_argument{"Unknown dialect kind"};
    }

    return std::make_unique<SessionDataSource>(std::move(name), std::move(session), std::move(shared),
                                               std::move(config));
}

}  // namespace sqlchain::execution
