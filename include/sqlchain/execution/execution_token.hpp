#pragma once

#include "sqlchain/execution/native_command.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlchain::execution {

enum class LockMode : std::uint8_t {
    None = 0,
    Read,
    Write
};

enum class ExecutionMode : std::uint8_t {
    Reader = 0,
    NonQuery
};

[[nodiscard]] std::string_view to_string(LockMode mode) noexcept;

// Prepared statement ready to run: text, bound parameters, lock requirement,
// optional row-count expectation, and an optional follow-on statement that
// runs after this one against the same data source.
class ExecutionToken final {
public:
    struct Spec final {
        std::string operation_name{};
        std::string command_text{};
        CommandType command_type = CommandType::Text;
        std::vector<SqlParameter> parameters{};
        ExecutionMode mode = ExecutionMode::Reader;
        LockMode lock_mode = LockMode::Write;
        std::optional<std::int64_t> expected_row_count{};
    };

    explicit ExecutionToken(Spec spec);

    [[nodiscard]] const std::string& operation_name() const noexcept { return spec_.operation_name; }
    [[nodiscard]] const std::string& command_text() const noexcept { return spec_.command_text; }
    [[nodiscard]] CommandType command_type() const noexcept { return spec_.command_type; }
    [[nodiscard]] std::span<const SqlParameter> parameters() const noexcept { return spec_.parameters; }
    [[nodiscard]] ExecutionMode mode() const noexcept { return spec_.mode; }
    [[nodiscard]] bool reads_rows() const noexcept { return spec_.mode == ExecutionMode::Reader; }
    [[nodiscard]] LockMode lock_mode() const noexcept { return spec_.lock_mode; }
    [[nodiscard]] std::optional<std::int64_t> expected_row_count() const noexcept { return spec_.expected_row_count; }

    [[nodiscard]] const ExecutionToken* next() const noexcept { return next_.get(); }
    [[nodiscard]] std::size_t chain_length() const noexcept;

    // Appends `follower` to the end of this chain.
    [[nodiscard]] ExecutionToken then(ExecutionToken follower) &&;

    // Throws ChainErrc::RowCountMismatch when an expectation is set and the
    // observed count differs or was not reported.
    void check_affected_row_count(std::optional<std::int64_t> actual) const;

    [[nodiscard]] CommandRequest to_request(std::optional<std::chrono::milliseconds> timeout) const;

private:
    Spec spec_;
    std::shared_ptr<const ExecutionToken> next_{};
};

}  // namespace sqlchain::execution
