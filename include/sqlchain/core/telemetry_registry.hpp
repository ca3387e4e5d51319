#pragma once

#include "sqlchain/core/chain_telemetry.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sqlchain::core {

class TelemetryRegistry final {
public:
    using Sampler = std::function<ChainTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string& identifier, const ChainTelemetrySnapshot& snapshot)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] ChainTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Sampler> samplers_{};
};

}  // namespace sqlchain::core
