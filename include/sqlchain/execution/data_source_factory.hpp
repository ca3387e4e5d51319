#pragma once

#include "sqlchain/execution/data_source.hpp"
#include "sqlchain/execution/session_data_source.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sqlchain::execution {

enum class DialectKind : std::uint8_t {
    SqlServer = 0,
    PostgreSql,
    Sqlite,
    MySql
};

[[nodiscard]] std::string_view to_string(DialectKind kind) noexcept;

// Wires a session to the dialect and metadata catalog of `kind`.
[[nodiscard]] std::unique_ptr<SessionDataSource> open_data_source(DialectKind kind,
                                                                  std::string name,
                                                                  std::shared_ptr<NativeSession> session,
                                                                  DataSourceConfig config = {});

}  // namespace sqlchain::execution
