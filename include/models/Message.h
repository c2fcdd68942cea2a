#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/Attachment.h"

/**
 * @brief Identity of a chat message
 *
 * Server: id assigned by the server (integers are kept as their decimal string).
 * None: the server accepted the message without assigning an id.
 * Pending: local token of an optimistic message whose send is still in flight.
 */
class MessageId {
  public:
    enum class Kind { None, Server, Pending };

    MessageId() = default;

    static MessageId none() { return MessageId(); }
    static MessageId server(std::string value);
    static MessageId pending(std::string token);

    /**
     * @brief Read an id from JSON (null, string or integral number)
     * @throws std::invalid_argument for any other JSON type
     */
    static MessageId fromJson(const nlohmann::json &j);

    Kind kind() const { return m_kind; }
    bool isNone() const { return m_kind == Kind::None; }
    bool isServer() const { return m_kind == Kind::Server; }
    bool isPending() const { return m_kind == Kind::Pending; }

    const std::string &value() const { return m_value; }
    std::string toString() const;

    bool operator==(const MessageId &other) const { return m_kind == other.m_kind && m_value == other.m_value; }
    bool operator!=(const MessageId &other) const { return !(*this == other); }

  private:
    MessageId(Kind kind, std::string value) : m_kind(kind), m_value(std::move(value)) {}

    Kind m_kind = Kind::None;
    std::string m_value;
};

/**
 * @brief One message of a two-party conversation
 */
class Message {
  public:
    /**
     * @brief Deserialize a message pushed by the hub or returned by the history endpoint
     * Attachments are normalized here, once, at ingestion.
     * @param j JSON object ({id, senderId, receiverId, message, sentTime, files, isRead})
     * @param mediaBase Base URL for relative attachment paths
     * @throws std::invalid_argument if j is not an object, an id is not numeric, or sentTime is unparseable
     */
    static Message fromJson(const nlohmann::json &j, const std::string &mediaBase = "");

    /**
     * @brief Both parties present and non-zero
     */
    bool hasParties() const { return senderId != 0 && receiverId != 0; }

    bool isPending() const { return id.isPending(); }

    MessageId id;                                  ///< Server id, none, or pending token
    int64_t senderId = 0;                          ///< Author user id
    int64_t receiverId = 0;                        ///< Recipient user id
    std::string content;                           ///< Plain-text body
    std::chrono::system_clock::time_point sentTime; ///< Server time, or client time while pending
    bool hasServerTime = false;                    ///< sentTime came from the server
    std::vector<Attachment> attachments;           ///< Normalized attachments
    bool isRead = false;                           ///< Display hint only
};
