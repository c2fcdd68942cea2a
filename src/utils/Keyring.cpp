#include "utils/Keyring.h"
#include "utils/Logger.h"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <wincred.h>

static std::wstring targetFor(const std::string &key) {
    const std::string fullKey = std::string("Chatline:") + key;
    const int len = MultiByteToWideChar(CP_UTF8, 0, fullKey.c_str(), static_cast<int>(fullKey.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, fullKey.c_str(), static_cast<int>(fullKey.size()), &wide[0], len);
    return wide;
}

bool Keyring::set(const std::string &key, const std::string &value) {
    std::wstring target = targetFor(key);

    CREDENTIALW cred = {};
    cred.Type = CRED_TYPE_GENERIC;
    cred.TargetName = &target[0];
    cred.CredentialBlobSize = static_cast<DWORD>(value.size());
    cred.CredentialBlob = reinterpret_cast<LPBYTE>(const_cast<char *>(value.data()));
    cred.Persist = CRED_PERSIST_LOCAL_MACHINE;

    if (!CredWriteW(&cred, 0)) {
        Logger::error("Keyring: failed to store '" + key + "' (error " + std::to_string(GetLastError()) + ")");
        return false;
    }
    Logger::debug("Keyring: stored '" + key + "'");
    return true;
}

std::optional<std::string> Keyring::get(const std::string &key) {
    std::wstring target = targetFor(key);

    PCREDENTIALW cred = nullptr;
    if (!CredReadW(target.c_str(), CRED_TYPE_GENERIC, 0, &cred)) {
        Logger::debug("Keyring: no entry for '" + key + "'");
        return std::nullopt;
    }

    std::string value(reinterpret_cast<const char *>(cred->CredentialBlob), cred->CredentialBlobSize);
    CredFree(cred);
    return value;
}


#elif defined(__linux__)
#include <libsecret/secret.h>

static const SecretSchema *chatlineSchema() {
    static const SecretSchema schema = {"com.chatline.credentials",
                                        SECRET_SCHEMA_NONE,
                                        {
                                            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                            {"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                            {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
                                        }};
    return &schema;
}

static std::string takeError(GError *error) {
    std::string message = error->message ? error->message : "unknown error";
    g_error_free(error);
    return message;
}

bool Keyring::set(const std::string &key, const std::string &value) {
    GError *error = nullptr;
    const std::string label = std::string(SERVICE_NAME) + " " + key;

    secret_password_store_sync(chatlineSchema(), SECRET_COLLECTION_DEFAULT, label.c_str(), value.c_str(), nullptr,
                               &error, "service", SERVICE_NAME, "key", key.c_str(), nullptr);

    if (error != nullptr) {
        Logger::error("Keyring: failed to store '" + key + "': " + takeError(error));
        return false;
    }
    Logger::debug("Keyring: stored '" + key + "'");
    return true;
}

std::optional<std::string> Keyring::get(const std::string &key) {
    GError *error = nullptr;
    gchar *password = secret_password_lookup_sync(chatlineSchema(), nullptr, &error, "service", SERVICE_NAME, "key",
                                                  key.c_str(), nullptr);

    if (error != nullptr) {
        Logger::warn("Keyring: lookup of '" + key + "' failed: " + takeError(error));
        return std::nullopt;
    }
    if (password == nullptr) {
        Logger::debug("Keyring: no entry for '" + key + "'");
        return std::nullopt;
    }

    std::string value(password);
    secret_password_free(password);
    return value;
}


#else
#error "Unsupported platform"
#endif
