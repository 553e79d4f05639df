/**
 * @file Http.hpp
 * @brief Thin RAII layer over the libcurl easy interface
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <curl/curl.h>

namespace ferry::pipeline::http
{
struct http_error : std::runtime_error
{
    http_error(CURLcode code, const std::string& message)
        : std::runtime_error(message),
          code(code)
    {
    }

    CURLcode code;
};

/**
 * @brief Owns libcurl's process-wide state. Create one in `main` before any
 *        other thread starts.
 */
class CurlGlobal
{
  public: // Constructors
    CurlGlobal();
    CurlGlobal(CurlGlobal&) = delete;
    CurlGlobal(CurlGlobal&&) = delete;
    auto operator=(CurlGlobal&) -> CurlGlobal = delete;
    auto operator=(CurlGlobal&&) -> CurlGlobal = delete;

    ~CurlGlobal();
};

struct EasyHandleDeleter
{
    auto operator()(CURL* handle) const -> void
    {
        curl_easy_cleanup(handle);
    }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

[[nodiscard]]
auto make_easy_handle() -> EasyHandle;

class HeaderList
{
  public: // Constructors
    HeaderList() = default;
    HeaderList(HeaderList&) = delete;
    HeaderList(HeaderList&&) = delete;
    auto operator=(HeaderList&) -> HeaderList = delete;
    auto operator=(HeaderList&&) -> HeaderList = delete;

    ~HeaderList();

  public: // Methods
    auto append(const std::string& header) -> void;

    [[nodiscard]]
    auto get() const -> curl_slist*
    {
        return m_List;
    }

  private: // Members
    curl_slist* m_List = nullptr;
};

struct Request
{
    std::string               method = "GET";
    std::string               url;
    std::vector<std::string>  headers;
    std::string_view          body;
    std::chrono::milliseconds timeout { std::chrono::seconds(60) };
    // Polled while the transfer runs; returning true aborts it with
    // CURLE_ABORTED_BY_CALLBACK
    std::function<bool()>     abortRequested;
};

struct Response
{
    long                               status = 0;
    std::string                        body;
    // Header names are lower-cased
    std::map<std::string, std::string> headers;
};

/**
 * @brief Performs a request to completion. Transport failures throw
 *        `http_error`; HTTP error statuses are returned to the caller.
 */
[[nodiscard]]
auto perform(const Request& request) -> Response;

[[nodiscard]]
auto url_encode(std::string_view value) -> std::string;
} // namespace ferry::pipeline::http
