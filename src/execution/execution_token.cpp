#include "sqlchain/execution/execution_token.hpp"

#include "sqlchain/core/chain_errors.hpp"

#include <stdexcept>
#include <utility>

namespace sqlchain::execution {

std::string_view to_string(LockMode mode) noexcept
{
    switch (mode) {
    case LockMode::None:
        return "none";
    case LockMode::Read:
        return "read";
    case LockMode::Write:
        return "write";
    default:
        return "unknown";
    }
}

ExecutionToken::ExecutionToken(Spec spec)
    : spec_{std::move(spec)}
{
    if (spec_.command_text.empty()) {
        throw std::invalid_argument{"ExecutionToken requires command text"};
    }
}

std::size_t ExecutionToken::chain_length() const noexcept
{
    std::size_t length = 0U;
    for (const auto* token = this; token != nullptr; token = token->next()) {
        ++length;
    }
    return length;
}

ExecutionToken ExecutionToken::then(ExecutionToken follower) &&
{
    if (next_) {
        auto tail = ExecutionToken{*next_}.then(std::move(follower));
        next_ = std::make_shared<const ExecutionToken>(std::move(tail));
    } else {
        next_ = std::make_shared<const ExecutionToken>(std::move(follower));
    }
    return std::move(*this);
}

void ExecutionToken::check_affected_row_count(std::optional<std::int64_t> actual) const
{
    if (!spec_.expected_row_count) {
        return;
    }
    if (!actual) {
        core::throw_chain_error(core::ChainErrc::RowCountMismatch,
                                "Expected " + std::to_string(*spec_.expected_row_count) + " row(s) to be affected by "
                                    + spec_.operation_name + ", but the driver did not report a row count");
    }
    if (*actual != *spec_.expected_row_count) {
        core::throw_chain_error(core::ChainErrc::RowCountMismatch,
                                "Expected " + std::to_string(*spec_.expected_row_count) + " row(s) to be affected by "
                                    + spec_.operation_name + ", but " + std::to_string(*actual) + " were affected");
    }
}

CommandRequest ExecutionToken::to_request(std::optional<std::chrono::milliseconds> timeout) const
{
    CommandRequest request{};
    request.text = spec_.command_text;
    request.type = spec_.command_type;
    request.timeout = timeout;
    request.parameters = spec_.parameters;
    return request;
}

}  // namespace sqlchain::execution
