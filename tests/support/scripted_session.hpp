#pragma once

#include "sqlchain/core/value.hpp"
#include "sqlchain/execution/native_command.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace sqlchain::tests {

// What a scripted command hands back: a result set, an affected-row count, or
// a failure when `failure` is set.
struct ScriptedResult final {
    std::vector<std::string> columns{};
    std::vector<core::ValueKind> kinds{};
    std::vector<std::vector<core::Value>> rows{};
    std::optional<std::int64_t> affected{};
    std::string failure{};
};

inline ScriptedResult result_set(std::vector<std::string> columns,
                                 std::vector<core::ValueKind> kinds,
                                 std::vector<std::vector<core::Value>> rows)
{
    ScriptedResult result{};
    result.columns = std::move(columns);
    result.kinds = std::move(kinds);
    result.rows = std::move(rows);
    return result;
}

inline ScriptedResult affected_rows(std::int64_t count)
{
    ScriptedResult result{};
    result.affected = count;
    return result;
}

inline ScriptedResult native_failure(std::string message)
{
    ScriptedResult result{};
    result.failure = std::move(message);
    return result;
}

class ScriptedCursor final : public execution::RowCursor {
public:
    explicit ScriptedCursor(ScriptedResult result) : result_{std::move(result)} {}

    [[nodiscard]] bool read() override
    {
        if (next_ >= result_.rows.size()) {
            current_.reset();
            return false;
        }
        current_ = next_++;
        return true;
    }

    [[nodiscard]] std::size_t field_count() const override { return result_.columns.size(); }
    [[nodiscard]] std::string_view name(std::size_t index) const override { return result_.columns.at(index); }
    [[nodiscard]] core::ValueKind field_type(std::size_t index) const override { return result_.kinds.at(index); }
    [[nodiscard]] bool is_null(std::size_t index) const override { return value(index).is_null(); }

    [[nodiscard]] bool get_bool(std::size_t index) const override { return value(index).as_bool(); }
    [[nodiscard]] std::int32_t get_int32(std::size_t index) const override { return value(index).as_int32(); }
    [[nodiscard]] std::int64_t get_int64(std::size_t index) const override { return value(index).as_int64(); }
    [[nodiscard]] double get_double(std::size_t index) const override { return value(index).as_double(); }
    [[nodiscard]] std::string get_string(std::size_t index) const override { return value(index).as_string(); }
    [[nodiscard]] core::Blob get_blob(std::size_t index) const override { return value(index).as_blob(); }

    [[nodiscard]] std::optional<std::int64_t> records_affected() const override { return result_.affected; }

private:
    [[nodiscard]] const core::Value& value(std::size_t index) const
    {
        if (!current_) {
            throw std::logic_error{"ScriptedCursor has no current row"};
        }
        return result_.rows.at(*current_).at(index);
    }

    ScriptedResult result_;
    std::size_t next_ = 0U;
    std::optional<std::size_t> current_{};
};

// Native session whose commands answer from a script. A request is matched
// against every rule whose pattern occurs in its text; the most recently
// added rule wins. Unmatched requests fail.
class ScriptedSession final : public execution::NativeSession {
public:
    void on(std::string pattern, ScriptedResult result)
    {
        std::lock_guard guard{state_->mutex};
        state_->rules.emplace_back(std::move(pattern), std::move(result));
    }

    void set_latency(std::chrono::milliseconds latency) { state_->latency_ms.store(latency.count()); }
    void fail_rollback(bool fail) { state_->fail_rollback.store(fail); }

    [[nodiscard]] std::vector<execution::CommandRequest> executed() const
    {
        std::lock_guard guard{state_->mutex};
        return state_->executed;
    }

    // Connection each executed request ran on, numbered from 1 in opening
    // order; 0 for commands created straight from the session.
    [[nodiscard]] std::vector<std::size_t> executed_connections() const
    {
        std::lock_guard guard{state_->mutex};
        return state_->executed_on;
    }

    [[nodiscard]] std::vector<std::string> executed_text() const
    {
        std::vector<std::string> text;
        for (const auto& request : executed()) {
            text.push_back(request.text);
        }
        return text;
    }

    [[nodiscard]] std::size_t count_matching(std::string_view pattern) const
    {
        std::lock_guard guard{state_->mutex};
        std::size_t count = 0U;
        for (const auto& request : state_->executed) {
            if (request.text.find(pattern) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] std::size_t commits() const { return state_->commits.load(); }
    [[nodiscard]] std::size_t rollbacks() const { return state_->rollbacks.load(); }
    [[nodiscard]] std::size_t connections_opened() const { return state_->connections.load(); }
    [[nodiscard]] std::size_t max_concurrent_commands() const { return state_->max_active.load(); }

    [[nodiscard]] std::unique_ptr<execution::NativeCommand> create_command() override
    {
        return std::make_unique<Command>(state_, 0U);
    }

    [[nodiscard]] std::unique_ptr<execution::NativeConnection> open_connection() override
    {
        const auto ordinal = state_->connections.fetch_add(1U) + 1U;
        return std::make_unique<Connection>(state_, ordinal);
    }

private:
    struct State final {
        mutable std::mutex mutex{};
        std::vector<std::pair<std::string, ScriptedResult>> rules{};
        std::vector<execution::CommandRequest> executed{};
        std::vector<std::size_t> executed_on{};
        std::atomic<std::int64_t> latency_ms{0};
        std::atomic<bool> fail_rollback{false};
        std::atomic<std::size_t> commits{0U};
        std::atomic<std::size_t> rollbacks{0U};
        std::atomic<std::size_t> connections{0U};
        std::atomic<std::size_t> active{0U};
        std::atomic<std::size_t> max_active{0U};
    };

    // Tracks how many commands run at once.
    class ActiveScope final {
    public:
        explicit ActiveScope(State& state) : state_{&state}
        {
            const auto now = state_->active.fetch_add(1U) + 1U;
            auto seen = state_->max_active.load();
            while (now > seen && !state_->max_active.compare_exchange_weak(seen, now)) {
            }
        }
        ~ActiveScope() { state_->active.fetch_sub(1U); }

        ActiveScope(const ActiveScope&) = delete;
        ActiveScope& operator=(const ActiveScope&) = delete;

    private:
        State* state_;
    };

    class Command final : public execution::NativeCommand {
    public:
        Command(std::shared_ptr<State> state, std::size_t connection)
            : state_{std::move(state)}
            , connection_{connection}
        {
        }

        [[nodiscard]] std::unique_ptr<execution::RowCursor> execute_reader(
            const execution::CommandRequest& request) override
        {
            auto result = run(request, nullptr);
            return std::make_unique<ScriptedCursor>(std::move(result));
        }

        [[nodiscard]] std::optional<std::int64_t> execute_non_query(const execution::CommandRequest& request) override
        {
            return run(request, nullptr).affected;
        }

        // The suspending path notices a stop request while it waits and fails
        // the way a driver aborting a statement would.
        [[nodiscard]] std::future<std::unique_ptr<execution::RowCursor>> execute_reader_async(
            const execution::CommandRequest& request,
            std::stop_token stop) override
        {
            std::promise<std::unique_ptr<execution::RowCursor>> promise;
            try {
                promise.set_value(std::make_unique<ScriptedCursor>(run(request, &stop)));
            } catch (const std::exception&) {
                promise.set_exception(std::current_exception());
            }
            return promise.get_future();
        }

        [[nodiscard]] std::future<std::optional<std::int64_t>> execute_non_query_async(
            const execution::CommandRequest& request,
            std::stop_token stop) override
        {
            std::promise<std::optional<std::int64_t>> promise;
            try {
                promise.set_value(run(request, &stop).affected);
            } catch (const std::exception&) {
                promise.set_exception(std::current_exception());
            }
            return promise.get_future();
        }

    private:
        [[nodiscard]] ScriptedResult run(const execution::CommandRequest& request, const std::stop_token* stop)
        {
            ActiveScope active{*state_};
            std::optional<ScriptedResult> match;
            {
                std::lock_guard guard{state_->mutex};
                state_->executed.push_back(request);
                state_->executed_on.push_back(connection_);
                for (auto it = state_->rules.rbegin(); it != state_->rules.rend(); ++it) {
                    if (request.text.find(it->first) != std::string::npos) {
                        match = it->second;
                        break;
                    }
                }
            }

            const auto deadline = std::chrono::steady_clock::now()
                                  + std::chrono::milliseconds{state_->latency_ms.load()};
            while (std::chrono::steady_clock::now() < deadline) {
                if (stop != nullptr && stop->stop_requested()) {
                    throw std::runtime_error{"statement aborted by the driver"};
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
            }

            if (!match) {
                throw std::runtime_error{"no scripted result for: " + request.text};
            }
            if (!match->failure.empty()) {
                throw std::runtime_error{match->failure};
            }
            return std::move(*match);
        }

        std::shared_ptr<State> state_;
        std::size_t connection_;
    };

    class Transaction final : public execution::NativeTransaction {
    public:
        explicit Transaction(std::shared_ptr<State> state) : state_{std::move(state)} {}

        void commit() override { state_->commits.fetch_add(1U); }

        void rollback() override
        {
            if (state_->fail_rollback.load()) {
                throw std::runtime_error{"connection lost during rollback"};
            }
            state_->rollbacks.fetch_add(1U);
        }

    private:
        std::shared_ptr<State> state_;
    };

    class Connection final : public execution::NativeConnection {
    public:
        Connection(std::shared_ptr<State> state, std::size_t ordinal)
            : state_{std::move(state)}
            , ordinal_{ordinal}
        {
        }

        [[nodiscard]] std::unique_ptr<execution::NativeCommand> create_command() override
        {
            return std::make_unique<Command>(state_, ordinal_);
        }

        [[nodiscard]] std::unique_ptr<execution::NativeTransaction> begin_transaction() override
        {
            return std::make_unique<Transaction>(state_);
        }

    private:
        std::shared_ptr<State> state_;
        std::size_t ordinal_;
    };

    std::shared_ptr<State> state_ = std::make_shared<State>();
};

}  // namespace sqlchain::tests
