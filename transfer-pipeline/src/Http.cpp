/**
 * @file Http.cpp
 * @brief Thin RAII layer over the libcurl easy interface
 */

// Header Being Defined
#include <ferry/pipeline/Http.hpp>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// Third Party Includes
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace ferry::pipeline::http
{
namespace
{
auto write_callback(char* data, std::size_t size, std::size_t count, void* userdata)
    -> std::size_t
{
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * count);

    return size * count;
}

auto header_callback(
    char*       data,
    std::size_t size,
    std::size_t count,
    void*       userdata
) -> std::size_t
{
    auto*                  headers = static_cast<Response*>(userdata);
    const std::string_view line(data, size * count);
    const auto             separator = line.find(':');

    if (separator == std::string_view::npos)
    {
        return size * count;
    }

    std::string name(line.substr(0, separator));
    std::transform(
        std::begin(name),
        std::end(name),
        std::begin(name),
        [](unsigned char c) { return std::tolower(c); }
    );

    auto value = line.substr(separator + 1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    {
        value.remove_suffix(1);
    }

    headers->headers.insert_or_assign(std::move(name), std::string(value));

    return size * count;
}

auto transfer_info_callback(
    void* userdata,
    [[maybe_unused]] curl_off_t downloadTotal,
    [[maybe_unused]] curl_off_t downloadNow,
    [[maybe_unused]] curl_off_t uploadTotal,
    [[maybe_unused]] curl_off_t uploadNow
) -> int
{
    const auto* request = static_cast<const Request*>(userdata);

    return request->abortRequested() ? 1 : 0;
}
} // namespace

CurlGlobal::CurlGlobal()
{
    const CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);

    if (result != CURLE_OK)
    {
        throw http_error(
            result,
            std::format(
                "Failed to initialize libcurl! Error message: {}",
                curl_easy_strerror(result)
            )
        );
    }
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

auto make_easy_handle() -> EasyHandle
{
    EasyHandle handle(curl_easy_init());

    if (!handle)
    {
        throw http_error(CURLE_FAILED_INIT, "cURL failed to initialize");
    }

    return handle;
}

HeaderList::~HeaderList()
{
    curl_slist_free_all(m_List);
}

auto HeaderList::append(const std::string& header) -> void
{
    curl_slist* appended = curl_slist_append(m_List, header.c_str());

    if (appended == nullptr)
    {
        throw http_error(CURLE_OUT_OF_MEMORY, "Failed to build header list");
    }

    m_List = appended;
}

auto perform(const Request& request) -> Response
{
    auto       handle = make_easy_handle();
    HeaderList headers;
    Response   response {};

    std::array<char, CURL_ERROR_SIZE> errorBuffer {};

    for (const auto& header : request.headers)
    {
        headers.append(header);
    }

    curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errorBuffer.data());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(
        handle.get(),
        CURLOPT_TIMEOUT_MS,
        static_cast<long>(request.timeout.count())
    );
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &response);

    if (request.abortRequested)
    {
        curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(
            handle.get(),
            CURLOPT_XFERINFOFUNCTION,
            &transfer_info_callback
        );
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &request);
    }

    if (request.method != "GET")
    {
        curl_easy_setopt(
            handle.get(),
            CURLOPT_CUSTOMREQUEST,
            request.method.c_str()
        );
        curl_easy_setopt(
            handle.get(),
            CURLOPT_POSTFIELDS,
            request.body.empty() ? "" : request.body.data()
        );
        curl_easy_setopt(
            handle.get(),
            CURLOPT_POSTFIELDSIZE_LARGE,
            static_cast<curl_off_t>(request.body.size())
        );
    }

    spdlog::trace("{} {}", request.method, request.url);

    const CURLcode result = curl_easy_perform(handle.get());

    if (result != CURLE_OK)
    {
        throw http_error(
            result,
            std::format(
                "{} request failed: {}",
                request.method,
                errorBuffer.front() != '\0' ? errorBuffer.data()
                                            : curl_easy_strerror(result)
            )
        );
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);

    spdlog::trace("{} {} -> {}", request.method, request.url, response.status);

    return response;
}

auto url_encode(std::string_view value) -> std::string
{
    auto  handle  = make_easy_handle();
    char* encoded = curl_easy_escape(
        handle.get(),
        value.data(),
        static_cast<int>(value.size())
    );

    if (encoded == nullptr)
    {
        throw http_error(CURLE_OUT_OF_MEMORY, "Failed to URL-encode value");
    }

    std::string result(encoded);
    curl_free(encoded);

    return result;
}
} // namespace ferry::pipeline::http
