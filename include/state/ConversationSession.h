#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "models/Message.h"
#include "models/SendResult.h"
#include "net/ConnectionManager.h"
#include "net/CredentialProvider.h"
#include "net/HistoryProvider.h"
#include "state/MessageReconciler.h"
#include "utils/AttachmentEncoder.h"

enum class ConversationStatus { Idle, Loading, Ready, Empty, Error };

const char *toString(ConversationStatus status);

/**
 * @brief Drives one two-party conversation on behalf of a screen
 *
 * activate() loads the history and subscribes to the hub events; deactivate() only
 * unsubscribes, the shared connection stays open for the next conversation.
 */
class ConversationSession {
  public:
    using ChangeHandler = std::function<void()>;
    using SendCallback = std::function<void(const SendResult &)>;
    using ProgressCallback = std::function<void(int percent)>;

    struct Options {
        int64_t selfId = 0; ///< 0: read from the credential's JWT
        std::string mediaBase;
        uint64_t maxAttachmentBytes = AttachmentEncoder::kDefaultMaxBytes;
    };

    ConversationSession(ConnectionManager &connection, HistoryProvider &history, CredentialProvider &credentials,
                        int64_t peerId, Options options);
    ConversationSession(ConnectionManager &connection, HistoryProvider &history, CredentialProvider &credentials,
                        int64_t peerId);
    ~ConversationSession();

    ConversationSession(const ConversationSession &) = delete;
    ConversationSession &operator=(const ConversationSession &) = delete;

    void activate();
    void deactivate();
    bool isActive() const { return m_active; }

    /**
     * @brief Validate, insert optimistically and transmit a message
     * @return Immediate outcome; errors found before transmitting are reported here only.
     * When the result is ok, onComplete later receives the outcome of the transmit.
     * onProgress sees 0..9 while the attachment is read, then 10, 50 and 100.
     */
    SendResult send(const std::string &text, const std::optional<LocalFile> &attachment = std::nullopt,
                    SendCallback onComplete = nullptr, ProgressCallback onProgress = nullptr);

    /**
     * @brief Fetch a fresh credential and make sure the connection is up
     */
    void reconnect();

    const std::vector<Message> &messages() const { return m_reconciler.messages(); }
    ConnectionManager::ConnectionState connectionState() const { return m_connection.state(); }
    ConversationStatus status() const { return m_status; }
    const std::string &lastError() const { return m_lastError; }

    int64_t selfId() const { return m_selfId; }
    int64_t peerId() const { return m_peerId; }

    void setChangeHandler(ChangeHandler handler) { m_onChange = std::move(handler); }

  private:
    void loadHistory();
    void setStatus(ConversationStatus status, const std::string &error = "");
    void changed();

    ConnectionManager &m_connection;
    HistoryProvider &m_history;
    CredentialProvider &m_credentials;
    Options m_options;

    int64_t m_peerId = 0;
    int64_t m_selfId = 0;

    MessageReconciler m_reconciler;
    ConversationStatus m_status = ConversationStatus::Idle;
    std::string m_lastError;
    bool m_active = false;
    uint64_t m_activation = 0;

    ConnectionManager::Subscription m_receivedSub;
    ConnectionManager::Subscription m_sentSub;
    ConnectionManager::Subscription m_stateSub;

    ChangeHandler m_onChange;

    // Outstanding callbacks hold a weak reference and do nothing once the session is gone
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};
