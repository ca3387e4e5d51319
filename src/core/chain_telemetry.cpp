#include "sqlchain/core/chain_telemetry.hpp"

#include <initializer_list>

namespace sqlchain::core {

namespace {

void bump(std::atomic<std::uint64_t>& counter, std::uint64_t amount = 1U) noexcept
{
    counter.fetch_add(amount, std::memory_order_relaxed);
}

[[nodiscard]] std::uint64_t load(const std::atomic<std::uint64_t>& counter) noexcept
{
    return counter.load(std::memory_order_relaxed);
}

}  // namespace

ChainTelemetry::LatencyScope::LatencyScope(ChainTelemetry* telemetry, Stage stage) noexcept
    : telemetry_{telemetry}
    , stage_{stage}
{
    if (telemetry_ != nullptr) {
        start_ = std::chrono::steady_clock::now();
    }
}

ChainTelemetry::LatencyScope::~LatencyScope()
{
    if (telemetry_ == nullptr) {
        return;
    }
    const auto end = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
    const auto duration_ns = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0ULL;
    telemetry_->record_latency(stage_, duration_ns);
}

void ChainTelemetry::record_statement_prepared() noexcept
{
    bump(statements_prepared_);
}

void ChainTelemetry::record_execution_started() noexcept
{
    bump(executions_started_);
}

void ChainTelemetry::record_execution_succeeded() noexcept
{
    bump(executions_succeeded_);
}

void ChainTelemetry::record_execution_failed() noexcept
{
    bump(executions_failed_);
}

void ChainTelemetry::record_execution_canceled() noexcept
{
    bump(executions_canceled_);
}

void ChainTelemetry::record_row_count_mismatch() noexcept
{
    bump(row_count_mismatches_);
}

void ChainTelemetry::record_rows_materialized(std::uint64_t rows) noexcept
{
    if (rows != 0U) {
        bump(rows_materialized_, rows);
    }
}

void ChainTelemetry::record_metadata_discovery(bool found) noexcept
{
    bump(metadata_discoveries_);
    if (!found) {
        bump(metadata_not_found_);
    }
}

void ChainTelemetry::record_binder_compiled(bool success) noexcept
{
    if (success) {
        bump(binders_compiled_);
    } else {
        bump(binder_compile_failures_);
    }
}

void ChainTelemetry::record_binder_cache_hit() noexcept
{
    bump(binder_cache_hits_);
}

void ChainTelemetry::record_lock_acquired(bool exclusive, std::uint64_t wait_ns) noexcept
{
    bump(exclusive ? write_lock_acquisitions_ : read_lock_acquisitions_);
    if (wait_ns != 0U) {
        bump(total_lock_wait_ns_, wait_ns);
    }
}

void ChainTelemetry::record_rollback_failure() noexcept
{
    bump(rollback_failures_);
}

void ChainTelemetry::record_latency(Stage stage, std::uint64_t duration_ns) noexcept
{
    auto& counters = stage == Stage::Execution ? execution_latency_ : discovery_latency_;
    bump(counters.invocations);
    bump(counters.total_duration_ns, duration_ns);
    counters.last_duration_ns.store(duration_ns, std::memory_order_relaxed);
}

ChainTelemetrySnapshot ChainTelemetry::snapshot() const noexcept
{
    ChainTelemetrySnapshot snapshot{};
    snapshot.statements_prepared = load(statements_prepared_);
    snapshot.executions_started = load(executions_started_);
    snapshot.executions_succeeded = load(executions_succeeded_);
    snapshot.executions_failed = load(executions_failed_);
    snapshot.executions_canceled = load(executions_canceled_);
    snapshot.row_count_mismatches = load(row_count_mismatches_);
    snapshot.rows_materialized = load(rows_materialized_);
    snapshot.metadata_discoveries = load(metadata_discoveries_);
    snapshot.metadata_not_found = load(metadata_not_found_);
    snapshot.binders_compiled = load(binders_compiled_);
    snapshot.binder_compile_failures = load(binder_compile_failures_);
    snapshot.binder_cache_hits = load(binder_cache_hits_);
    snapshot.read_lock_acquisitions = load(read_lock_acquisitions_);
    snapshot.write_lock_acquisitions = load(write_lock_acquisitions_);
    snapshot.total_lock_wait_ns = load(total_lock_wait_ns_);
    snapshot.rollback_failures = load(rollback_failures_);
    snapshot.execution_latency.invocations = load(execution_latency_.invocations);
    snapshot.execution_latency.total_duration_ns = load(execution_latency_.total_duration_ns);
    snapshot.execution_latency.last_duration_ns = load(execution_latency_.last_duration_ns);
    snapshot.discovery_latency.invocations = load(discovery_latency_.invocations);
    snapshot.discovery_latency.total_duration_ns = load(discovery_latency_.total_duration_ns);
    snapshot.discovery_latency.last_duration_ns = load(discovery_latency_.last_duration_ns);
    return snapshot;
}

void ChainTelemetry::reset() noexcept
{
    for (auto* counter : {&statements_prepared_,
                          &executions_started_,
                          &executions_succeeded_,
                          &executions_failed_,
                          &executions_canceled_,
                          &row_count_mismatches_,
                          &rows_materialized_,
                          &metadata_discoveries_,
                          &metadata_not_found_,
                          &binders_compiled_,
                          &binder_compile_failures_,
                          &binder_cache_hits_,
                          &read_lock_acquisitions_,
                          &write_lock_acquisitions_,
                          &total_lock_wait_ns_,
                          &rollback_failures_,
                          &execution_latency_.invocations,
                          &execution_latency_.total_duration_ns,
                          &execution_latency_.last_duration_ns,
                          &discovery_latency_.invocations,
                          &discovery_latency_.total_duration_ns,
                          &discovery_latency_.last_duration_ns}) {
        counter->store(0U, std::memory_order_relaxed);
    }
}

}  // namespace sqlchain::core
