/**
 * @file CatalogClient.cpp
 * @brief Lookups against the remote title catalog
 */

// Header Being Defined
#include <ferry/pipeline/CatalogClient.hpp>

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <format>
#include <string>
#include <utility>
#include <vector>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Http.hpp>

namespace ferry::pipeline
{
namespace
{
constexpr std::size_t MAX_SEARCH_RESULTS = 10;
constexpr long        HTTP_OK            = 200;

// The catalog is loose about types; ratings and years arrive as numbers or
// strings
auto text_field(const nlohmann::json& object, const char* key) -> std::string
{
    if (!object.is_object() || !object.contains(key))
    {
        return {};
    }

    const auto& value = object.at(key);

    if (value.is_string())
    {
        return value.get<std::string>();
    }

    return value.is_null() ? std::string {} : value.dump();
}
} // namespace

auto to_json(nlohmann::json& json, const CatalogEntry& entry) -> void
{
    json = nlohmann::json {
        {  "title",  entry.title },
        {   "link",   entry.link },
        { "rating", entry.rating },
        { "poster", entry.poster },
    };
}

auto to_json(nlohmann::json& json, const DownloadOption& option) -> void
{
    json = nlohmann::json {
        { "quality", option.quality },
        {    "size",    option.size },
        {    "link",    option.link },
    };
}

auto to_json(nlohmann::json& json, const CatalogDetails& details) -> void
{
    json = nlohmann::json {
        {           "title",           details.title },
        {            "year",            details.year },
        {          "rating",          details.rating },
        {        "duration",        details.duration },
        {             "tag",             details.tag },
        {       "directors",       details.directors },
        {          "poster",          details.poster },
        { "download_options", details.downloadOptions },
    };
}

auto to_json(nlohmann::json& json, const SourceLink& link) -> void
{
    json = nlohmann::json {
        { "name", link.name },
        {  "url",  link.url },
    };
}

auto to_json(nlohmann::json& json, const SourceList& list) -> void
{
    json = nlohmann::json {
        {   "title",   list.title },
        {    "size",    list.size },
        { "sources", list.sources },
    };
}

CatalogClient::CatalogClient(
    std::string               baseUrl,
    std::string               apiKey,
    std::chrono::milliseconds timeout
)
    : m_BaseUrl(std::move(baseUrl)),
      m_ApiKey(std::move(apiKey)),
      m_Timeout(timeout)
{
    while (!m_BaseUrl.empty() && m_BaseUrl.back() == '/')
    {
        m_BaseUrl.pop_back();
    }
}

auto CatalogClient::fetch(
    const std::string& endpoint,
    const std::string& parameter,
    const std::string& value
) const -> nlohmann::json
{
    if (m_BaseUrl.empty())
    {
        throw catalog_error("Catalog API base URL is not configured");
    }

    const http::Request request {
        .url = std::format(
            "{}/movie/{}?{}={}&apikey={}",
            m_BaseUrl,
            endpoint,
            parameter,
            http::url_encode(value),
            http::url_encode(m_ApiKey)
        ),
        .timeout = m_Timeout,
    };

    spdlog::debug("Catalog request {} {}={}", endpoint, parameter, value);

    http::Response response;

    try
    {
        response = http::perform(request);
    }
    catch (const http::http_error& he)
    {
        throw catalog_error(
            std::format("Catalog {} request failed: {}", endpoint, he.what())
        );
    }

    if (response.status != HTTP_OK)
    {
        throw catalog_error(
            std::format(
                "Catalog {} request returned HTTP {}",
                endpoint,
                response.status
            )
        );
    }

    const auto body = nlohmann::json::parse(response.body, nullptr, false);

    if (body.is_discarded() || !body.is_object())
    {
        throw catalog_error(
            std::format("Catalog {} returned an unreadable reply", endpoint)
        );
    }

    const bool succeeded
        = body.contains("status") && body.at("status").is_boolean()
       && body.at("status").get<bool>();

    if (!succeeded || !body.contains("data") || body.at("data").is_null())
    {
        throw catalog_error(
            std::format("Catalog {} lookup was unsuccessful", endpoint)
        );
    }

    return body.at("data");
}

auto CatalogClient::search(const std::string& query) const
    -> std::vector<CatalogEntry>
{
    const auto data = this->fetch("cinesubz-search", "q", query);

    std::vector<CatalogEntry> results;

    if (!data.is_array())
    {
        return results;
    }

    for (const auto& item : data)
    {
        if (results.size() == MAX_SEARCH_RESULTS)
        {
            break;
        }

        results.emplace_back(
            CatalogEntry {
                .title  = text_field(item, "title"),
                .link   = text_field(item, "link"),
                .rating = text_field(item, "rating"),
                .poster = text_field(item, "image"),
            }
        );
    }

    return results;
}

auto CatalogClient::get_details(const std::string& link) const
    -> CatalogDetails
{
    const auto data = this->fetch("cinesubz-info", "url", link);

    CatalogDetails details {
        .title     = text_field(data, "title"),
        .year      = text_field(data, "year"),
        .rating    = text_field(data, "rating"),
        .duration  = text_field(data, "duration"),
        .tag       = text_field(data, "tag"),
        .directors = text_field(data, "directors"),
        .poster    = text_field(data, "image"),
    };

    if (data.contains("downloads") && data.at("downloads").is_array())
    {
        for (const auto& download : data.at("downloads"))
        {
            details.downloadOptions.emplace_back(
                DownloadOption {
                    .quality = text_field(download, "quality"),
                    .size    = text_field(download, "size"),
                    .link    = text_field(download, "link"),
                }
            );
        }
    }

    return details;
}

auto CatalogClient::get_sources(const std::string& downloadLink) const
    -> SourceList
{
    const auto data = this->fetch("cinesubz-download", "url", downloadLink);

    SourceList list {
        .title = text_field(data, "title"),
        .size  = text_field(data, "size"),
    };

    if (data.contains("download") && data.at("download").is_array())
    {
        for (const auto& source : data.at("download"))
        {
            list.sources.emplace_back(
                SourceLink {
                    .name = text_field(source, "name"),
                    .url  = text_field(source, "url"),
                }
            );
        }
    }

    return list;
}
} // namespace ferry::pipeline
