/**
 * @file CatalogClient.hpp
 * @brief Lookups against the remote title catalog
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace ferry::pipeline
{
struct CatalogEntry
{
    std::string title;
    std::string link;
    std::string rating;
    std::string poster;
};

struct DownloadOption
{
    std::string quality;
    std::string size;
    std::string link;
};

struct CatalogDetails
{
    std::string                 title;
    std::string                 year;
    std::string                 rating;
    std::string                 duration;
    std::string                 tag;
    std::string                 directors;
    std::string                 poster;
    std::vector<DownloadOption> downloadOptions;
};

struct SourceLink
{
    std::string name;
    std::string url;
};

struct SourceList
{
    std::string             title;
    std::string             size;
    std::vector<SourceLink> sources;
};

auto to_json(nlohmann::json& json, const CatalogEntry& entry) -> void;
auto to_json(nlohmann::json& json, const DownloadOption& option) -> void;
auto to_json(nlohmann::json& json, const CatalogDetails& details) -> void;
auto to_json(nlohmann::json& json, const SourceLink& link) -> void;
auto to_json(nlohmann::json& json, const SourceList& list) -> void;

/**
 * @brief Every call is a single attempt. Transport failures, non-200
 *        replies and replies with a false `status` throw `catalog_error`.
 */
class CatalogClient
{
  public: // Constructors
    CatalogClient(
        std::string               baseUrl,
        std::string               apiKey,
        std::chrono::milliseconds timeout = std::chrono::seconds(30)
    );

  public: // Methods
    // At most ten results
    [[nodiscard]]
    auto search(const std::string& query) const -> std::vector<CatalogEntry>;

    [[nodiscard]]
    auto get_details(const std::string& link) const -> CatalogDetails;

    [[nodiscard]]
    auto get_sources(const std::string& downloadLink) const -> SourceList;

  private: // Methods
    auto fetch(
        const std::string& endpoint,
        const std::string& parameter,
        const std::string& value
    ) const -> nlohmann::json;

  private: // Members
    std::string               m_BaseUrl;
    std::string               m_ApiKey;
    std::chrono::milliseconds m_Timeout;
};
} // namespace ferry::pipeline
