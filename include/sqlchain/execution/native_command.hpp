#pragma once

#include "sqlchain/core/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sqlchain::execution {

enum class CommandType : std::uint8_t {
    Text = 0,
    StoredProcedure,
    TableDirect
};

struct SqlParameter final {
    std::string name{};
    core::Value value{};
    std::optional<std::string> native_type{};
};

struct CommandRequest final {
    std::string text{};
    CommandType type = CommandType::Text;
    std::optional<std::chrono::milliseconds> timeout{};
    std::vector<SqlParameter> parameters{};
};

// Forward-only view over a native result set. Column metadata is available
// before the first read().
class RowCursor {
public:
    virtual ~RowCursor() = default;

    [[nodiscard]] virtual bool read() = 0;
    [[nodiscard]] virtual std::size_t field_count() const = 0;
    [[nodiscard]] virtual std::string_view name(std::size_t index) const = 0;
    [[nodiscard]] virtual core::ValueKind field_type(std::size_t index) const = 0;
    [[nodiscard]] virtual bool is_null(std::size_t index) const = 0;

    [[nodiscard]] virtual bool get_bool(std::size_t index) const = 0;
    [[nodiscard]] virtual std::int32_t get_int32(std::size_t index) const = 0;
    [[nodiscard]] virtual std::int64_t get_int64(std::size_t index) const = 0;
    [[nodiscard]] virtual double get_double(std::size_t index) const = 0;
    [[nodiscard]] virtual std::string get_string(std::size_t index) const = 0;
    [[nodiscard]] virtual core::Blob get_blob(std::size_t index) const = 0;

    // Dispatches on field_type(); NULL yields an empty Value.
    [[nodiscard]] virtual core::Value get_value(std::size_t index) const;

    // Rows touched by the statement, when the driver reports it after the
    // rows have been consumed.
    [[nodiscard]] virtual std::optional<std::int64_t> records_affected() const { return std::nullopt; }
};

class NativeCommand {
public:
    virtual ~NativeCommand() = default;

    [[nodiscard]] virtual std::unique_ptr<RowCursor> execute_reader(const CommandRequest& request) = 0;
    [[nodiscard]] virtual std::optional<std::int64_t> execute_non_query(const CommandRequest& request) = 0;

    // Drivers without a suspending API run the synchronous call on the
    // calling thread and hand back a ready future.
    [[nodiscard]] virtual std::future<std::unique_ptr<RowCursor>> execute_reader_async(const CommandRequest& request,
                                                                                        std::stop_token stop);
    [[nodiscard]] virtual std::future<std::optional<std::int64_t>> execute_non_query_async(
        const CommandRequest& request,
        std::stop_token stop);
};

class NativeTransaction {
public:
    virtual ~NativeTransaction() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// A dedicated connection; commands it creates enlist in its open transaction.
class NativeConnection {
public:
    virtual ~NativeConnection() = default;

    [[nodiscard]] virtual std::unique_ptr<NativeCommand> create_command() = 0;
    [[nodiscard]] virtual std::unique_ptr<NativeTransaction> begin_transaction() = 0;
};

// Connection factory shared by a data source and its metadata catalog.
class NativeSession {
public:
    virtual ~NativeSession() = default;

    [[nodiscard]] virtual std::unique_ptr<NativeCommand> create_command() = 0;
    [[nodiscard]] virtual std::unique_ptr<NativeConnection> open_connection() = 0;
};

}  // namespace sqlchain::execution
