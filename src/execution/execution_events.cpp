#include "sqlchain/execution/execution_events.hpp"

#include "sqlchain/execution/execution_token.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqlchain::execution {

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace

std::string_view to_string(ExecutionPhase phase) noexcept
{
    switch (phase) {
    case ExecutionPhase::Started:
        return "started";
    case ExecutionPhase::Finished:
        return "finished";
    case ExecutionPhase::Failed:
        return "failed";
    case ExecutionPhase::Canceled:
        return "canceled";
    default:
        return "unknown";
    }
}

ExecutionEvent make_execution_event(ExecutionPhase phase,
                                    std::string_view data_source,
                                    const ExecutionToken& token,
                                    std::chrono::system_clock::time_point started_at)
{
    ExecutionEvent event{};
    event.phase = phase;
    event.data_source = std::string{data_source};
    event.operation_name = token.operation_name();
    event.command_text = token.command_text();
    event.parameter_names.reserve(token.parameters().size());
    for (const auto& parameter : token.parameters()) {
        event.parameter_names.push_back(parameter.name);
    }
    event.started_at = started_at;
    if (phase != ExecutionPhase::Started) {
        event.finished_at = std::chrono::system_clock::now();
    }
    return event;
}

std::string format_execution_event_json(const ExecutionEvent& event)
{
    std::string json;
    json.reserve(256U + event.command_text.size());
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_timestamp_field = [&](const char* name, std::chrono::system_clock::time_point tp) {
        append_field(name);
        const auto text = format_timestamp_iso(tp);
        if (text.empty()) {
            json.append("null");
        } else {
            append_json_string(json, text);
        }
    };

    append_field("phase");
    append_json_string(json, to_string(event.phase));
    append_field("data_source");
    append_json_string(json, event.data_source);
    append_field("operation");
    append_json_string(json, event.operation_name);
    append_field("sql");
    append_json_string(json, event.command_text);

    append_field("parameters");
    json.push_back('[');
    for (std::size_t i = 0; i < event.parameter_names.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        append_json_string(json, event.parameter_names[i]);
    }
    json.push_back(']');

    append_field("rows_affected");
    if (event.rows_affected) {
        json.append(std::to_string(*event.rows_affected));
    } else {
        json.append("null");
    }

    append_timestamp_field("started_at", event.started_at);
    append_timestamp_field("finished_at", event.finished_at);

    if (!event.error.empty()) {
        append_field("error");
        append_json_string(json, event.error);
    }

    json.push_back('}');
    return json;
}

}  // namespace sqlchain::execution
