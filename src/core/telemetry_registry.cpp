#include "sqlchain/core/telemetry_registry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace sqlchain::core {

namespace {

void accumulate(ChainTelemetrySnapshot::LatencySnapshot& target, const ChainTelemetrySnapshot::LatencySnapshot& source)
{
    target.invocations += source.invocations;
    target.total_duration_ns += source.total_duration_ns;
    target.last_duration_ns = std::max(target.last_duration_ns, source.last_duration_ns);
}

void accumulate(ChainTelemetrySnapshot& target, const ChainTelemetrySnapshot& source)
{
    target.statements_prepared += source.statements_prepared;
    target.executions_started += source.executions_started;
    target.executions_succeeded += source.executions_succeeded;
    target.executions_failed += source.executions_failed;
    target.executions_canceled += source.executions_canceled;
    target.row_count_mismatches += source.row_count_mismatches;
    target.rows_materialized += source.rows_materialized;
    target.metadata_discoveries += source.metadata_discoveries;
    target.metadata_not_found += source.metadata_not_found;
    target.binders_compiled += source.binders_compiled;
    target.binder_compile_failures += source.binder_compile_failures;
    target.binder_cache_hits += source.binder_cache_hits;
    target.read_lock_acquisitions += source.read_lock_acquisitions;
    target.write_lock_acquisitions += source.write_lock_acquisitions;
    target.total_lock_wait_ns += source.total_lock_wait_ns;
    target.rollback_failures += source.rollback_failures;
    accumulate(target.execution_latency, source.execution_latency);
    accumulate(target.discovery_latency, source.discovery_latency);
}

}  // namespace

void TelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void TelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

ChainTelemetrySnapshot TelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    ChainTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        accumulate(total, sampler());
    }
    return total;
}

void TelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

std::size_t TelemetryRegistry::size() const
{
    std::lock_guard guard(mutex_);
    return samplers_.size();
}

}  // namespace sqlchain::core
