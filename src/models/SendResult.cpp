#include "models/SendResult.h"

const char *describe(SendError error) {
    switch (error) {
    case SendError::None:
        return "ok";
    case SendError::EmptyMessage:
        return "Message is empty";
    case SendError::ContainsMarkup:
        return "Message contains HTML markup";
    case SendError::SelfRecipient:
        return "Cannot send message to yourself";
    case SendError::AttachmentUnreadable:
        return "Attachment could not be read";
    case SendError::NotAuthenticated:
        return "Not signed in";
    case SendError::NotConnected:
        return "Not connected to the chat server";
    case SendError::TransportFailure:
        return "Failed to transmit message";
    case SendError::ServerError:
        return "Server rejected the message";
    case SendError::ConnectionClosed:
        return "Connection closed before the server answered";
    }
    return "unknown error";
}
