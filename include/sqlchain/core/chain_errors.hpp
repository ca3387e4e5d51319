#pragma once

#include <string>
#include <system_error>

namespace sqlchain::core {

enum class ChainErrc {
    Success = 0,
    MappingFailed,
    RowCountMismatch,
    MetadataNotFound,
    OperationCanceled,
    ObjectDisposed,
    ConversionFailed,
    UnsupportedOperation,
    InvalidObjectName,
    MissingData,
    UnexpectedData
};

const std::error_category& chain_error_category() noexcept;
std::error_code make_error_code(ChainErrc value) noexcept;

[[noreturn]] void throw_chain_error(ChainErrc value, const std::string& what);

}  // namespace sqlchain::core

namespace std {

template <>
struct is_error_code_enum<sqlchain::core::ChainErrc> : true_type {
};

}  // namespace std
