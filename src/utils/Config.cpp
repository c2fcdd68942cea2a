#include "utils/Config.h"

#include <cstdlib>
#include <fstream>

std::string AppConfig::hubUrl() const {
    std::string url = baseUrl;
    if (url.rfind("https://", 0) == 0) {
        url = "wss://" + url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        url = "ws://" + url.substr(7);
    }

    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + hubPath;
}

std::string AppConfig::mediaBase() const { return mediaBaseUrl.empty() ? baseUrl : mediaBaseUrl; }

namespace Config {

namespace {

const char *readEnv(const char *name) {
    const char *value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename T> void readValue(const nlohmann::json &j, const char *key, T &out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception &e) {
        Logger::warn(std::string("Config: ignoring '") + key + "': " + e.what());
    }
}

void readMillis(const nlohmann::json &j, const char *key, std::chrono::milliseconds &out) {
    int64_t value = out.count();
    readValue(j, key, value);
    if (value <= 0) {
        Logger::warn(std::string("Config: '") + key + "' must be positive, keeping default");
        return;
    }
    out = std::chrono::milliseconds(value);
}

} // namespace

void applyJson(AppConfig &config, const nlohmann::json &j) {
    if (!j.is_object()) {
        Logger::warn("Config: document is not a JSON object, ignoring");
        return;
    }

    readValue(j, "baseUrl", config.baseUrl);
    readValue(j, "hubPath", config.hubPath);
    readValue(j, "historyPath", config.historyPath);
    readValue(j, "mediaBaseUrl", config.mediaBaseUrl);
    readMillis(j, "retryDelayMs", config.retryDelay);
    readMillis(j, "healthCheckIntervalMs", config.healthCheckInterval);
    readMillis(j, "serverTimeoutMs", config.serverTimeout);
    readMillis(j, "handshakeTimeoutMs", config.handshakeTimeout);
    readMillis(j, "httpTimeoutMs", config.httpTimeout);
    readValue(j, "maxAttachmentBytes", config.maxAttachmentBytes);

    std::string level;
    readValue(j, "logLevel", level);
    if (!level.empty()) {
        if (auto parsed = Logger::parseLevel(level)) {
            config.logLevel = *parsed;
        } else {
            Logger::warn("Config: unknown log level '" + level + "'");
        }
    }
}

AppConfig load() {
    AppConfig config;

    if (const char *path = readEnv("CHATLINE_CONFIG")) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::warn(std::string("Config: cannot open ") + path);
        } else {
            nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
            if (j.is_discarded()) {
                Logger::error(std::string("Config: ") + path + " is not valid JSON");
            } else {
                applyJson(config, j);
                Logger::info(std::string("Config: loaded ") + path);
            }
        }
    }

    if (const char *baseUrl = readEnv("CHATLINE_BASE_URL")) {
        config.baseUrl = baseUrl;
    }

    if (const char *level = readEnv("CHATLINE_LOG_LEVEL")) {
        if (auto parsed = Logger::parseLevel(level)) {
            config.logLevel = *parsed;
        } else {
            Logger::warn(std::string("Config: unknown log level '") + level + "'");
        }
    }

    if (const char *token = readEnv("CHATLINE_TOKEN")) {
        config.token = std::string(token);
    }

    return config;
}

} // namespace Config
