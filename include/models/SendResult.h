#pragma once

#include <optional>
#include <string>

#include "models/Message.h"

enum class SendError {
    None,
    EmptyMessage,
    ContainsMarkup,
    SelfRecipient,
    AttachmentUnreadable,
    NotAuthenticated,
    NotConnected,
    TransportFailure,
    ServerError,
    ConnectionClosed
};

/**
 * @brief Human-readable reason for a send failure
 */
const char *describe(SendError error);

/**
 * @brief Outcome of ConversationSession::send
 *
 * Returned synchronously for validation failures and delivered to the completion
 * callback once the transmit attempt has finished.
 */
struct SendResult {
    SendError error = SendError::None;
    std::string detail;                           ///< Server or transport message, if any
    std::string pendingToken;                     ///< Token of the optimistic entry (empty if none was inserted)
    std::optional<MessageId> serverId;            ///< Id from the completion (may be MessageId::none())
    std::optional<std::string> attachmentWarning; ///< Set when the text went out without its attachment

    bool ok() const { return error == SendError::None; }
};
