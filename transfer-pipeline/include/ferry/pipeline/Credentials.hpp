/**
 * @file Credentials.hpp
 * @brief Access to the sink credential maintained by the auth collaborator
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <string>

namespace ferry::pipeline
{
class CredentialProvider
{
  public: // Constructors
    virtual ~CredentialProvider() = default;

  public: // Methods
    /**
     * @brief Throws `auth_expired_error` when no usable credential exists.
     */
    virtual auto access_token() -> std::string = 0;
};

/**
 * @brief Reads an OAuth token file (`access_token`, optional `expiry_date`
 *        in epoch milliseconds) on every call, so a token refreshed by the
 *        external auth flow is picked up without a restart.
 */
class TokenFileCredentials : public CredentialProvider
{
  public: // Constructors
    explicit TokenFileCredentials(std::filesystem::path tokenFile);

  public: // Methods
    auto access_token() -> std::string override;

  private: // Members
    std::filesystem::path m_TokenFile;
};
} // namespace ferry::pipeline
