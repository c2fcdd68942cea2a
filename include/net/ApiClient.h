#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "net/CredentialProvider.h"
#include "net/HistoryProvider.h"
#include "utils/Config.h"
#include "utils/EventLoop.h"

typedef void CURL;

namespace Chatline {

/**
 * @brief REST client for the chat backend
 * Requests run on a worker thread; callbacks are posted back to the event loop.
 */
class ApiClient : public HistoryProvider {
  public:
    using Json = nlohmann::json;

    using SuccessCallback = std::function<void(const Json &)>;

    ApiClient(EventLoop &loop, CredentialProvider &credentials, const AppConfig &config);
    ~ApiClient() override;

    ApiClient(const ApiClient &) = delete;
    ApiClient &operator=(const ApiClient &) = delete;

    void getChatHistory(int64_t otherPartyId, HistoryCallback onSuccess, ErrorCallback onError) override;

    /**
     * @brief Turn a history response body into messages; malformed entries are skipped
     * Accepts a bare array or an object wrapping it in "data"/"messages".
     */
    static std::vector<Message> parseHistory(const Json &body, const std::string &mediaBase);

  private:
    void performGet(const std::string &endpoint, SuccessCallback onSuccess, ErrorCallback onError);

    static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);

    std::string buildUrl(const std::string &endpoint) const;

  private:
    static constexpr const char *USER_AGENT = "Chatline/1.0";

    EventLoop &m_loop;
    CredentialProvider &m_credentials;
    std::string m_baseUrl;
    std::string m_historyPath;
    std::string m_mediaBase;
    long m_timeoutSeconds = 30;
};

} // namespace Chatline
