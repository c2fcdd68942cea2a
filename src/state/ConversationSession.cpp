#include "state/ConversationSession.h"

#include <utility>

#include "utils/Jwt.h"
#include "utils/Logger.h"
#include "utils/Sanitizer.h"

namespace {

const char *kLogPrefix = "session";

} // namespace

const char *toString(ConversationStatus status) {
    switch (status) {
    case ConversationStatus::Idle:
        return "idle";
    case ConversationStatus::Loading:
        return "loading";
    case ConversationStatus::Ready:
        return "ready";
    case ConversationStatus::Empty:
        return "empty";
    case ConversationStatus::Error:
        return "error";
    }
    return "unknown";
}

ConversationSession::ConversationSession(ConnectionManager &connection, HistoryProvider &history,
                                         CredentialProvider &credentials, int64_t peerId, Options options)
    : m_connection(connection), m_history(history), m_credentials(credentials), m_options(std::move(options)),
      m_peerId(peerId), m_selfId(m_options.selfId), m_reconciler(m_options.selfId, peerId, m_options.mediaBase) {
    m_reconciler.setChangeListener([this]() {
        if (m_status == ConversationStatus::Empty && !m_reconciler.empty()) {
            m_status = ConversationStatus::Ready;
        }
        changed();
    });
}

ConversationSession::ConversationSession(ConnectionManager &connection, HistoryProvider &history,
                                         CredentialProvider &credentials, int64_t peerId)
    : ConversationSession(connection, history, credentials, peerId, Options{}) {}

ConversationSession::~ConversationSession() { deactivate(); }

void ConversationSession::activate() {
    if (m_active) {
        return;
    }

    auto token = m_credentials.getToken();
    if (!token) {
        Logger::log(Logger::Level::WARN, kLogPrefix, "No credential, conversation unavailable");
        setStatus(ConversationStatus::Error, describe(SendError::NotAuthenticated));
        return;
    }

    m_active = true;
    ++m_activation;
    setStatus(ConversationStatus::Loading);

    if (m_options.selfId == 0) {
        if (auto id = JwtUtils::userIdFromToken(*token)) {
            m_selfId = *id;
        } else {
            Logger::log(Logger::Level::WARN, kLogPrefix, "Could not read the user id from the token");
        }
    }
    m_reconciler.setParties(m_selfId, m_peerId);

    m_receivedSub = m_connection.onEvent(ConnectionManager::EventKind::MessageReceived,
                                         [this](const nlohmann::json &payload) {
                                             const FoldResult result = m_reconciler.foldReceived(payload);
                                             Logger::log(Logger::Level::DEBUG, kLogPrefix,
                                                         std::string("ReceiveMessage ") + toString(result));
                                         });
    m_sentSub = m_connection.onEvent(ConnectionManager::EventKind::MessageSent, [this](const nlohmann::json &payload) {
        const FoldResult result = m_reconciler.foldConfirmation(payload);
        Logger::log(Logger::Level::DEBUG, kLogPrefix, std::string("MessageSent ") + toString(result));
    });
    m_stateSub = m_connection.onStateChange([this](ConnectionManager::ConnectionState) { changed(); });

    Logger::log(Logger::Level::INFO, kLogPrefix,
                "Opening conversation " + std::to_string(m_selfId) + " <-> " + std::to_string(m_peerId));

    m_connection.ensureConnected(*token);
    loadHistory();
}

void ConversationSession::deactivate() {
    if (!m_active) {
        return;
    }
    m_active = false;
    ++m_activation;

    m_receivedSub.reset();
    m_sentSub.reset();
    m_stateSub.reset();
}

void ConversationSession::loadHistory() {
    std::weak_ptr<bool> alive = m_alive;
    const uint64_t activation = m_activation;

    m_history.getChatHistory(
        m_peerId,
        [this, alive, activation](std::vector<Message> history) {
            if (alive.expired() || activation != m_activation) {
                return;
            }
            m_reconciler.seed(history);
            setStatus(m_reconciler.empty() ? ConversationStatus::Empty : ConversationStatus::Ready);
        },
        [this, alive, activation](int httpCode, const std::string &error) {
            if (alive.expired() || activation != m_activation) {
                return;
            }
            Logger::log(Logger::Level::ERROR, kLogPrefix,
                        "History load failed (" + std::to_string(httpCode) + "): " + error);
            setStatus(ConversationStatus::Error, error);
        });
}

SendResult ConversationSession::send(const std::string &text, const std::optional<LocalFile> &attachment,
                                     SendCallback onComplete, ProgressCallback onProgress) {
    SendResult result;

    if (Sanitizer::containsMarkup(text)) {
        result.error = SendError::ContainsMarkup;
        return result;
    }

    const std::string content = Sanitizer::trim(text);
    if (content.empty() && !attachment) {
        result.error = SendError::EmptyMessage;
        return result;
    }
    if (m_selfId != 0 && m_selfId == m_peerId) {
        result.error = SendError::SelfRecipient;
        return result;
    }
    if (!m_credentials.getToken()) {
        result.error = SendError::NotAuthenticated;
        return result;
    }
    if (!m_connection.isConnected()) {
        result.error = SendError::NotConnected;
        return result;
    }

    Message draft;
    draft.senderId = m_selfId;
    draft.receiverId = m_peerId;
    draft.content = content;
    result.pendingToken = m_reconciler.addPending(std::move(draft));

    std::vector<EncodedAttachment> files;
    if (attachment) {
        EncodedAttachment encoded;
        std::string error;
        // Reading the file fills 0..9; transmission reports 10, 50 and 100
        AttachmentEncoder::ProgressCallback encodeProgress;
        if (onProgress) {
            encodeProgress = [&onProgress](int percent) { onProgress(percent * 9 / 100); };
        }
        if (AttachmentEncoder::encode(*attachment, result.pendingToken, encoded, error, encodeProgress,
                                      m_options.maxAttachmentBytes)) {
            files.push_back(std::move(encoded));
        } else if (content.empty()) {
            Logger::log(Logger::Level::WARN, kLogPrefix, "Attachment unreadable: " + error);
            m_reconciler.removePending(result.pendingToken);
            result.error = SendError::AttachmentUnreadable;
            result.detail = error;
            result.pendingToken.clear();
            return result;
        } else {
            Logger::log(Logger::Level::WARN, kLogPrefix, "Sending text without attachment: " + error);
            result.attachmentWarning = error;
        }
    }

    std::weak_ptr<bool> alive = m_alive;
    const std::string token = result.pendingToken;
    const std::optional<std::string> warning = result.attachmentWarning;

    m_connection.send(m_peerId, content, files, onProgress,
                      [this, alive, token, warning, onComplete](const ConnectionManager::SendOutcome &outcome) {
                          if (alive.expired()) {
                              return;
                          }

                          SendResult delivered;
                          delivered.error = outcome.error;
                          delivered.detail = outcome.detail;
                          delivered.pendingToken = token;
                          delivered.attachmentWarning = warning;

                          if (outcome.error == SendError::None) {
                              delivered.serverId = outcome.serverId;
                              m_reconciler.confirmPending(token, outcome.serverId);
                          } else {
                              Logger::log(Logger::Level::WARN, kLogPrefix,
                                          std::string("Send failed: ") + describe(outcome.error) +
                                              (outcome.detail.empty() ? "" : " (" + outcome.detail + ")"));
                              m_reconciler.removePending(token);
                          }

                          if (onComplete) {
                              onComplete(delivered);
                          }
                      });

    return result;
}

void ConversationSession::reconnect() {
    auto token = m_credentials.getToken();
    if (!token) {
        setStatus(ConversationStatus::Error, describe(SendError::NotAuthenticated));
        return;
    }
    m_connection.ensureConnected(*token);
}

void ConversationSession::setStatus(ConversationStatus status, const std::string &error) {
    m_status = status;
    m_lastError = error;
    changed();
}

void ConversationSession::changed() {
    if (m_onChange) {
        m_onChange();
    }
}
