#pragma once

#include <optional>
#include <string>

class CredentialProvider {
  public:
    virtual ~CredentialProvider() = default;

    /**
     * @brief Current bearer token, or std::nullopt when the user is not signed in
     */
    virtual std::optional<std::string> getToken() = 0;
};

/**
 * @brief Reads the token from the OS keyring on every call
 */
class KeyringCredentialProvider : public CredentialProvider {
  public:
    static constexpr const char *kDefaultKey = "user_token";

    explicit KeyringCredentialProvider(std::string key = kDefaultKey) : m_key(std::move(key)) {}

    std::optional<std::string> getToken() override;

    const std::string &key() const { return m_key; }

  private:
    std::string m_key;
};
