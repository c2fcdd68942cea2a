#pragma once

#include <optional>
#include <string>

/**
 * @brief Secrets kept in the OS credential store
 * libsecret on Linux, the Windows Credential Manager on Windows.
 */
class Keyring {
  public:
    static bool set(const std::string &key, const std::string &value);
    static std::optional<std::string> get(const std::string &key);

  private:
    static constexpr const char *SERVICE_NAME = "Chatline";
};
