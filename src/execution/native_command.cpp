#include "sqlchain/execution/native_command.hpp"

#include "sqlchain/core/chain_errors.hpp"

#include <exception>
#include <system_error>

namespace sqlchain::execution {

namespace {

template <typename Result, typename Invoke>
std::future<Result> run_ready(std::stop_token stop, Invoke&& invoke)
{
    std::promise<Result> promise;
    auto future = promise.get_future();
    if (stop.stop_requested()) {
        promise.set_exception(std::make_exception_ptr(
            std::system_error(core::make_error_code(core::ChainErrc::OperationCanceled), "command canceled before start")));
        return future;
    }
    try {
        promise.set_value(invoke());
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return future;
}

}  // namespace

core::Value RowCursor::get_value(std::size_t index) const
{
    if (is_null(index)) {
        return {};
    }
    switch (field_type(index)) {
    case core::ValueKind::Boolean:
        return core::Value{get_bool(index)};
    case core::ValueKind::Int32:
        return core::Value{get_int32(index)};
    case core::ValueKind::Int64:
        return core::Value{get_int64(index)};
    case core::ValueKind::Double:
        return core::Value{get_double(index)};
    case core::ValueKind::String:
        return core::Value{get_string(index)};
    case core::ValueKind::Binary:
        return core::Value{get_blob(index)};
    case core::ValueKind::Null:
    default:
        return {};
    }
}

std::future<std::unique_ptr<RowCursor>> NativeCommand::execute_reader_async(const CommandRequest& request,
                                                                            std::stop_token stop)
{
    return run_ready<std::unique_ptr<RowCursor>>(stop, [&] { return execute_reader(request); });
}

std::future<std::optional<std::int64_t>> NativeCommand::execute_non_query_async(const CommandRequest& request,
                                                                                std::stop_token stop)
{
    return run_ready<std::optional<std::int64_t>>(stop, [&] { return execute_non_query(request); });
}

}  // namespace sqlchain::execution
