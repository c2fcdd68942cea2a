#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/Message.h"

enum class FoldResult {
    Appended,  ///< New row at the end
    Replaced,  ///< A pending row was replaced in place by its confirmation
    Retained,  ///< Null-id confirmation matched a pending row, which stays as is
    Duplicate, ///< Already shown
    Dropped,   ///< Malformed event
    Ignored    ///< Belongs to another conversation
};

const char *toString(FoldResult result);

/**
 * @brief The ordered message list of one conversation
 *
 * Merges history, optimistic local sends, server echoes of those sends and messages
 * pushed by the other party so that every message appears exactly once. Rows keep
 * the position at which they were first observed locally.
 */
class MessageReconciler {
  public:
    using ChangeListener = std::function<void()>;

    static constexpr std::chrono::seconds kDuplicateWindow{5};

    MessageReconciler() = default;
    MessageReconciler(int64_t selfId, int64_t peerId, std::string mediaBase = "");

    /**
     * @brief Restrict folding to messages between these two users (0 disables the check)
     */
    void setParties(int64_t selfId, int64_t peerId);

    /**
     * @brief Replace the list with loaded history
     * Rows folded before the history arrived are kept after it unless the history already holds them.
     */
    void seed(const std::vector<Message> &history);

    /**
     * @brief Insert an optimistic row for a message being sent
     * @return The pending token identifying the row
     */
    std::string addPending(Message draft);

    /**
     * @brief Remove the optimistic row of a failed send
     */
    bool removePending(const std::string &token);

    /**
     * @brief Promote a pending row to a server id when the send completion arrives first
     * A later echo carrying the same id, or a null id with the same sender and text, is then
     * recognised as a duplicate.
     */
    bool confirmPending(const std::string &token, const MessageId &serverId);

    /**
     * @brief Fold a message pushed by the other party
     */
    FoldResult foldReceived(const nlohmann::json &payload);
    FoldResult foldReceived(Message message);

    /**
     * @brief Fold the server's echo of a message this client sent
     */
    FoldResult foldConfirmation(const nlohmann::json &payload);
    FoldResult foldConfirmation(Message message);

    const std::vector<Message> &messages() const { return m_messages; }
    size_t pendingCount() const;
    bool empty() const { return m_messages.empty(); }

    void setChangeListener(ChangeListener listener) { m_onChange = std::move(listener); }

  private:
    bool parse(const nlohmann::json &payload, Message &out) const;
    bool admit(Message &message, FoldResult &rejected) const;
    bool inConversation(const Message &message) const;

    std::vector<Message>::iterator findServerId(const MessageId &id);
    std::vector<Message>::iterator findAwaitingEcho(const Message &echo);
    void absorbEcho(Message &row, Message &echo);
    bool isDuplicateContent(const Message &message) const;

    void notify();

    std::vector<Message> m_messages;
    std::set<std::string> m_awaitingEcho; ///< Server ids promoted by a completion, echo not yet seen
    int64_t m_selfId = 0;
    int64_t m_peerId = 0;
    std::string m_mediaBase;
    ChangeListener m_onChange;
};
