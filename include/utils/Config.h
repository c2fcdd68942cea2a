#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "utils/Logger.h"

struct AppConfig {
    std::string baseUrl = "https://seasondecor.azurewebsites.net";
    std::string hubPath = "/chatHub";
    std::string historyPath = "/api/Chat/history/";
    std::string mediaBaseUrl;

    std::chrono::milliseconds retryDelay{5000};
    std::chrono::milliseconds healthCheckInterval{30000};
    std::chrono::milliseconds serverTimeout{60000};
    std::chrono::milliseconds handshakeTimeout{15000};
    std::chrono::milliseconds httpTimeout{30000};

    uint64_t maxAttachmentBytes = 10 * 1024 * 1024;
    Logger::Level logLevel = Logger::Level::INFO;

    std::optional<std::string> token;

    /**
     * @brief ws:// or wss:// URL of the chat hub derived from baseUrl and hubPath
     */
    std::string hubUrl() const;

    /**
     * @brief Base used to resolve relative attachment URLs (mediaBaseUrl, else baseUrl)
     */
    std::string mediaBase() const;
};

namespace Config {

/**
 * @brief Apply the members present in a JSON document on top of `config`
 * Unknown keys are ignored; wrongly-typed values are reported and skipped.
 */
void applyJson(AppConfig &config, const nlohmann::json &j);

/**
 * @brief Defaults, then the file named by CHATLINE_CONFIG, then CHATLINE_* environment variables
 */
AppConfig load();

} // namespace Config
