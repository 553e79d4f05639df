/**
 * @file Errors.cpp
 * @brief Exception types raised by the transfer pipeline
 */

// Header Being Defined
#include <ferry/pipeline/Errors.hpp>

// Standard Library Includes
#include <string_view>

namespace ferry::pipeline
{
auto to_string(ErrorKind kind) -> std::string_view
{
    switch (kind)
    {
    case ErrorKind::NETWORK:
        return "TransferNetworkError";
    case ErrorKind::TIMEOUT:
        return "TransferTimeoutError";
    case ErrorKind::TOO_LARGE:
        return "TransferTooLargeError";
    case ErrorKind::SINK:
        return "TransferSinkError";
    case ErrorKind::AUTH_EXPIRED:
        return "AuthExpiredError";
    case ErrorKind::STAGING_IO:
        return "StagingIOError";
    case ErrorKind::CATALOG:
        return "CatalogError";
    case ErrorKind::DUPLICATE_SOURCE:
        return "DuplicateSourceError";
    case ErrorKind::INTERNAL:
        return "InternalError";
    }

    return "InternalError";
}
} // namespace ferry::pipeline
