#include "sqlchain/core/chain_errors.hpp"

namespace sqlchain::core {

namespace {

class ChainErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sqlchain.chain";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ChainErrc>(condition)) {
        case ChainErrc::Success:
            return "success";
        case ChainErrc::MappingFailed:
            return "mapping failed";
        case ChainErrc::RowCountMismatch:
            return "unexpected number of rows affected";
        case ChainErrc::MetadataNotFound:
            return "metadata not found";
        case ChainErrc::OperationCanceled:
            return "operation canceled";
        case ChainErrc::ObjectDisposed:
            return "object disposed";
        case ChainErrc::ConversionFailed:
            return "value conversion failed";
        case ChainErrc::UnsupportedOperation:
            return "operation not supported by dialect";
        case ChainErrc::InvalidObjectName:
            return "invalid object name";
        case ChainErrc::MissingData:
            return "no rows were returned";
        case ChainErrc::UnexpectedData:
            return "unexpected rows were returned";
        default:
            return "unknown chain error";
        }
    }
};

const ChainErrorCategory kCategory{};

}  // namespace

const std::error_category& chain_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ChainErrc value) noexcept
{
    return {static_cast<int>(value), chain_error_category()};
}

void throw_chain_error(ChainErrc value, const std::string& what)
{
    throw std::system_error(make_error_code(value), what);
}

}  // namespace sqlchain::core
