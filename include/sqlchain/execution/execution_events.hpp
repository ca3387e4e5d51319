#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlchain::execution {

class ExecutionToken;

enum class ExecutionPhase : std::uint8_t {
    Started = 0,
    Finished,
    Failed,
    Canceled
};

[[nodiscard]] std::string_view to_string(ExecutionPhase phase) noexcept;

struct ExecutionEvent final {
    ExecutionPhase phase = ExecutionPhase::Started;
    std::string data_source{};
    std::string operation_name{};
    std::string command_text{};
    std::vector<std::string> parameter_names{};
    std::optional<std::int64_t> rows_affected{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    std::string error{};
};

using ExecutionListener = std::function<void(const ExecutionEvent& event)>;

[[nodiscard]] ExecutionEvent make_execution_event(ExecutionPhase phase,
                                                  std::string_view data_source,
                                                  const ExecutionToken& token,
                                                  std::chrono::system_clock::time_point started_at);

// Single-line JSON record; parameter values are never included.
[[nodiscard]] std::string format_execution_event_json(const ExecutionEvent& event);

}  // namespace sqlchain::execution
