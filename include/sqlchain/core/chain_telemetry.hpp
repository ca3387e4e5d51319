#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace sqlchain::core {

struct ChainTelemetrySnapshot final {
    struct LatencySnapshot final {
        std::uint64_t invocations = 0U;
        std::uint64_t total_duration_ns = 0U;
        std::uint64_t last_duration_ns = 0U;
    };

    std::uint64_t statements_prepared = 0U;
    std::uint64_t executions_started = 0U;
    std::uint64_t executions_succeeded = 0U;
    std::uint64_t executions_failed = 0U;
    std::uint64_t executions_canceled = 0U;
    std::uint64_t row_count_mismatches = 0U;
    std::uint64_t rows_materialized = 0U;
    std::uint64_t metadata_discoveries = 0U;
    std::uint64_t metadata_not_found = 0U;
    std::uint64_t binders_compiled = 0U;
    std::uint64_t binder_compile_failures = 0U;
    std::uint64_t binder_cache_hits = 0U;
    std::uint64_t read_lock_acquisitions = 0U;
    std::uint64_t write_lock_acquisitions = 0U;
    std::uint64_t total_lock_wait_ns = 0U;
    std::uint64_t rollback_failures = 0U;

    LatencySnapshot execution_latency{};
    LatencySnapshot discovery_latency{};
};

class ChainTelemetry final {
public:
    enum class Stage {
        Execution = 0,
        Discovery
    };

    class LatencyScope final {
    public:
        LatencyScope(ChainTelemetry* telemetry, Stage stage) noexcept;
        ~LatencyScope();

        LatencyScope(const LatencyScope&) = delete;
        LatencyScope& operator=(const LatencyScope&) = delete;

    private:
        ChainTelemetry* telemetry_ = nullptr;
        Stage stage_ = Stage::Execution;
        std::chrono::steady_clock::time_point start_{};
    };

    void record_statement_prepared() noexcept;
    void record_execution_started() noexcept;
    void record_execution_succeeded() noexcept;
    void record_execution_failed() noexcept;
    void record_execution_canceled() noexcept;
    void record_row_count_mismatch() noexcept;
    void record_rows_materialized(std::uint64_t rows) noexcept;
    void record_metadata_discovery(bool found) noexcept;
    void record_binder_compiled(bool success) noexcept;
    void record_binder_cache_hit() noexcept;
    void record_lock_acquired(bool exclusive, std::uint64_t wait_ns) noexcept;
    void record_rollback_failure() noexcept;
    void record_latency(Stage stage, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ChainTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    struct LatencyCounters final {
        std::atomic<std::uint64_t> invocations{0U};
        std::atomic<std::uint64_t> total_duration_ns{0U};
        std::atomic<std::uint64_t> last_duration_ns{0U};
    };

    std::atomic<std::uint64_t> statements_prepared_{0U};
    std::atomic<std::uint64_t> executions_started_{0U};
    std::atomic<std::uint64_t> executions_succeeded_{0U};
    std::atomic<std::uint64_t> executions_failed_{0U};
    std::atomic<std::uint64_t> executions_canceled_{0U};
    std::atomic<std::uint64_t> row_count_mismatches_{0U};
    std::atomic<std::uint64_t> rows_materialized_{0U};
    std::atomic<std::uint64_t> metadata_discoveries_{0U};
    std::atomic<std::uint64_t> metadata_not_found_{0U};
    std::atomic<std::uint64_t> binders_compiled_{0U};
    std::atomic<std::uint64_t> binder_compile_failures_{0U};
    std::atomic<std::uint64_t> binder_cache_hits_{0U};
    std::atomic<std::uint64_t> read_lock_acquisitions_{0U};
    std::atomic<std::uint64_t> write_lock_acquisitions_{0U};
    std::atomic<std::uint64_t> total_lock_wait_ns_{0U};
    std::atomic<std::uint64_t> rollback_failures_{0U};
    LatencyCounters execution_latency_{};
    LatencyCounters discovery_latency_{};
};

}  // namespace sqlchain::core
