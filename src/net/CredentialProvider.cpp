#include "net/CredentialProvider.h"

#include "utils/Keyring.h"

std::optional<std::string> KeyringCredentialProvider::getToken() {
    auto token = Keyring::get(m_key);
    if (token && token->empty()) {
        return std::nullopt;
    }
    return token;
}
