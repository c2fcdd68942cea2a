#include "net/ApiClient.h"

#include <curl/curl.h>

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

#include "utils/Logger.h"

namespace Chatline {

ApiClient::ApiClient(EventLoop &loop, CredentialProvider &credentials, const AppConfig &config)
    : m_loop(loop), m_credentials(credentials), m_baseUrl(config.baseUrl), m_historyPath(config.historyPath),
      m_mediaBase(config.mediaBase()),
      m_timeoutSeconds(static_cast<long>(std::max<int64_t>(1, config.httpTimeout.count() / 1000))) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ApiClient::~ApiClient() { curl_global_cleanup(); }

void ApiClient::getChatHistory(int64_t otherPartyId, HistoryCallback onSuccess, ErrorCallback onError) {
    const std::string endpoint = m_historyPath + std::to_string(otherPartyId);
    const std::string mediaBase = m_mediaBase;

    Logger::debug("API: Requesting chat history with user " + std::to_string(otherPartyId));

    performGet(
        endpoint,
        [onSuccess, mediaBase](const Json &body) {
            std::vector<Message> messages = parseHistory(body, mediaBase);
            Logger::debug("API: Parsed " + std::to_string(messages.size()) + " history messages");
            onSuccess(std::move(messages));
        },
        onError);
}

std::vector<Message> ApiClient::parseHistory(const Json &body, const std::string &mediaBase) {
    const Json *list = &body;
    if (body.is_object()) {
        for (const char *key : {"data", "messages", "items"}) {
            auto it = body.find(key);
            if (it != body.end() && it->is_array()) {
                list = &*it;
                break;
            }
        }
    }

    std::vector<Message> messages;
    if (!list->is_array()) {
        Logger::warn("API: History response is not an array");
        return messages;
    }

    messages.reserve(list->size());
    for (const auto &entry : *list) {
        try {
            messages.push_back(Message::fromJson(entry, mediaBase));
        } catch (const std::exception &e) {
            Logger::warn(std::string("API: Skipping malformed history entry: ") + e.what());
        }
    }
    return messages;
}

void ApiClient::performGet(const std::string &endpoint, SuccessCallback onSuccess, ErrorCallback onError) {
    auto token = m_credentials.getToken();
    if (!token) {
        m_loop.post([onError]() { onError(401, "Not signed in"); });
        return;
    }

    const std::string url = buildUrl(endpoint);
    const long timeout = m_timeoutSeconds;
    EventLoop &loop = m_loop;

    std::thread([&loop, url, timeout, token = *token, onSuccess, onError]() {
        CURL *curl = curl_easy_init();
        if (!curl) {
            loop.post([onError]() { onError(-1, "Failed to initialize CURL"); });
            return;
        }

        std::string response;

        Logger::debug("API: Requesting URL: " + url);

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

        struct curl_slist *headers = nullptr;
        const std::string authHeader = "Authorization: Bearer " + token;
        headers = curl_slist_append(headers, authHeader.c_str());
        headers = curl_slist_append(headers, "Accept: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl);
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

        Logger::debug("API: Response HTTP " + std::to_string(httpCode) +
                      ", body length: " + std::to_string(response.length()));

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            const std::string error = "Network error: " + std::string(curl_easy_strerror(res));
            Logger::error("API: " + error);
            loop.post([onError, error]() { onError(-1, error); });
            return;
        }

        if (httpCode < 200 || httpCode >= 300) {
            Logger::error("API: HTTP error " + std::to_string(httpCode) + ": " + response);
            const int code = static_cast<int>(httpCode);
            loop.post([onError, code, response]() {
                onError(code, "HTTP error " + std::to_string(code) + ": " + response);
            });
            return;
        }

        Json json = Json::parse(response, nullptr, false);
        if (json.is_discarded()) {
            Logger::error("API: JSON parse error");
            const int code = static_cast<int>(httpCode);
            loop.post([onError, code]() { onError(code, "JSON parse error"); });
            return;
        }

        loop.post([onSuccess, json = std::move(json)]() { onSuccess(json); });
    }).detach();
}

size_t ApiClient::writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
    size_t totalSize = size * nmemb;
    std::string *response = static_cast<std::string *>(userp);
    response->append(static_cast<char *>(contents), totalSize);
    return totalSize;
}

std::string ApiClient::buildUrl(const std::string &endpoint) const {
    std::string base = m_baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + (endpoint.empty() || endpoint.front() == '/' ? "" : "/") + endpoint;
}

} // namespace Chatline
