/**
 * @file Errors.hpp
 * @brief Exception types raised by the transfer pipeline
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry::pipeline
{
enum class ErrorKind : std::uint8_t
{
    NETWORK,
    TIMEOUT,
    TOO_LARGE,
    SINK,
    AUTH_EXPIRED,
    STAGING_IO,
    CATALOG,
    DUPLICATE_SOURCE,
    INTERNAL,
};

[[nodiscard]]
auto to_string(ErrorKind kind) -> std::string_view;

/**
 * @brief Raised when a job's `cancelled` flag is observed at a suspension
 *        point. Deliberately not a `pipeline_error`: cancellation is not a
 *        failure.
 */
struct cancelled_exception : std::runtime_error
{
    cancelled_exception()
        : std::runtime_error("Task cancelled by operator")
    {
    }
};

struct pipeline_error : std::runtime_error
{
    pipeline_error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message),
          m_Kind(kind)
    {
    }

    [[nodiscard]]
    auto kind() const noexcept -> ErrorKind
    {
        return m_Kind;
    }

  private:
    ErrorKind m_Kind;
};

// Download stage
struct transfer_network_error : pipeline_error
{
    explicit transfer_network_error(const std::string& message)
        : pipeline_error(ErrorKind::NETWORK, message)
    {
    }
};

struct transfer_timeout_error : pipeline_error
{
    explicit transfer_timeout_error(const std::string& message)
        : pipeline_error(ErrorKind::TIMEOUT, message)
    {
    }
};

struct transfer_too_large_error : pipeline_error
{
    explicit transfer_too_large_error(const std::string& message)
        : pipeline_error(ErrorKind::TOO_LARGE, message)
    {
    }
};

// Upload stage
struct transfer_sink_error : pipeline_error
{
    explicit transfer_sink_error(const std::string& message)
        : pipeline_error(ErrorKind::SINK, message)
    {
    }
};

struct auth_expired_error : pipeline_error
{
    explicit auth_expired_error(const std::string& message)
        : pipeline_error(ErrorKind::AUTH_EXPIRED, message)
    {
    }
};

struct staging_io_error : pipeline_error
{
    explicit staging_io_error(const std::string& message)
        : pipeline_error(ErrorKind::STAGING_IO, message)
    {
    }
};

struct catalog_error : pipeline_error
{
    explicit catalog_error(const std::string& message)
        : pipeline_error(ErrorKind::CATALOG, message)
    {
    }
};

struct duplicate_source_error : pipeline_error
{
    explicit duplicate_source_error(const std::string& message)
        : pipeline_error(ErrorKind::DUPLICATE_SOURCE, message)
    {
    }
};
} // namespace ferry::pipeline
