#include "state/MessageReconciler.h"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <set>
#include <utility>

#include "utils/Logger.h"
#include "utils/Sanitizer.h"
#include "utils/Time.h"
#include "utils/Uuid.h"

const char *toString(FoldResult result) {
    switch (result) {
    case FoldResult::Appended:
        return "appended";
    case FoldResult::Replaced:
        return "replaced";
    case FoldResult::Retained:
        return "retained";
    case FoldResult::Duplicate:
        return "duplicate";
    case FoldResult::Dropped:
        return "dropped";
    case FoldResult::Ignored:
        return "ignored";
    }
    return "unknown";
}

MessageReconciler::MessageReconciler(int64_t selfId, int64_t peerId, std::string mediaBase)
    : m_selfId(selfId), m_peerId(peerId), m_mediaBase(std::move(mediaBase)) {}

void MessageReconciler::setParties(int64_t selfId, int64_t peerId) {
    m_selfId = selfId;
    m_peerId = peerId;
}

void MessageReconciler::seed(const std::vector<Message> &history) {
    std::vector<Message> merged;
    merged.reserve(history.size() + m_messages.size());
    std::set<std::string> seenIds;

    for (Message message : history) {
        FoldResult rejected = FoldResult::Dropped;
        if (!admit(message, rejected)) {
            continue;
        }
        if (message.id.isServer() && !seenIds.insert(message.id.value()).second) {
            continue;
        }
        merged.push_back(std::move(message));
    }

    const size_t historySize = merged.size();

    // Rows folded while the history request was in flight
    for (auto &existing : m_messages) {
        if (!existing.isPending()) {
            if (existing.id.isServer() && seenIds.count(existing.id.value())) {
                continue;
            }
            const bool inHistory = std::any_of(merged.begin(), merged.begin() + static_cast<std::ptrdiff_t>(historySize),
                                               [&existing](const Message &m) {
                                                   return m.senderId == existing.senderId &&
                                                          m.content == existing.content &&
                                                          TimeUtils::distance(m.sentTime, existing.sentTime) <=
                                                              kDuplicateWindow;
                                               });
            if (inHistory) {
                continue;
            }
        }
        merged.push_back(std::move(existing));
    }

    Logger::debug("Reconciler: seeded " + std::to_string(historySize) + " history messages, " +
                  std::to_string(merged.size() - historySize) + " kept from live updates");

    m_messages = std::move(merged);
    notify();
}

std::string MessageReconciler::addPending(Message draft) {
    const std::string token = UuidHelper::pendingToken();
    draft.id = MessageId::pending(token);
    draft.sentTime = std::chrono::system_clock::now();
    draft.hasServerTime = false;
    draft.isRead = false;
    m_messages.push_back(std::move(draft));
    notify();
    return token;
}

bool MessageReconciler::removePending(const std::string &token) {
    auto it = std::find_if(m_messages.begin(), m_messages.end(),
                           [&token](const Message &m) { return m.isPending() && m.id.value() == token; });
    if (it == m_messages.end()) {
        return false;
    }
    m_messages.erase(it);
    notify();
    return true;
}

bool MessageReconciler::confirmPending(const std::string &token, const MessageId &serverId) {
    if (!serverId.isServer()) {
        return false;
    }

    auto it = std::find_if(m_messages.begin(), m_messages.end(),
                           [&token](const Message &m) { return m.isPending() && m.id.value() == token; });
    if (it == m_messages.end()) {
        return false;
    }

    if (findServerId(serverId) != m_messages.end()) {
        // The echo arrived as a separate row; keep that one
        m_messages.erase(it);
    } else {
        it->id = serverId;
        m_awaitingEcho.insert(serverId.value());
    }
    notify();
    return true;
}

FoldResult MessageReconciler::foldReceived(const nlohmann::json &payload) {
    Message message;
    if (!parse(payload, message)) {
        return FoldResult::Dropped;
    }
    return foldReceived(std::move(message));
}

FoldResult MessageReconciler::foldReceived(Message message) {
    FoldResult rejected = FoldResult::Dropped;
    if (!admit(message, rejected)) {
        return rejected;
    }

    if (message.id.isServer() && findServerId(message.id) != m_messages.end()) {
        return FoldResult::Duplicate;
    }
    if (isDuplicateContent(message)) {
        Logger::debug("Reconciler: dropping repeated push from user " + std::to_string(message.senderId));
        return FoldResult::Duplicate;
    }

    m_messages.push_back(std::move(message));
    notify();
    return FoldResult::Appended;
}

FoldResult MessageReconciler::foldConfirmation(const nlohmann::json &payload) {
    Message message;
    if (!parse(payload, message)) {
        return FoldResult::Dropped;
    }
    return foldConfirmation(std::move(message));
}

FoldResult MessageReconciler::foldConfirmation(Message message) {
    FoldResult rejected = FoldResult::Dropped;
    if (!admit(message, rejected)) {
        return rejected;
    }

    if (message.id.isServer()) {
        auto existing = findServerId(message.id);
        if (existing != m_messages.end()) {
            absorbEcho(*existing, message);
            return FoldResult::Duplicate;
        }
    }

    auto pending = std::find_if(m_messages.begin(), m_messages.end(), [&message](const Message &m) {
        return m.isPending() && (m.senderId == message.senderId || m.senderId == 0) && m.content == message.content;
    });

    if (pending != m_messages.end()) {
        if (message.id.isNone()) {
            return FoldResult::Retained;
        }

        if (!message.hasServerTime) {
            message.sentTime = pending->sentTime;
        }
        if (message.attachments.empty()) {
            message.attachments = std::move(pending->attachments);
        }
        *pending = std::move(message);
        notify();
        return FoldResult::Replaced;
    }

    if (message.id.isNone()) {
        auto promoted = findAwaitingEcho(message);
        if (promoted != m_messages.end()) {
            absorbEcho(*promoted, message);
            return FoldResult::Duplicate;
        }
    }

    m_messages.push_back(std::move(message));
    notify();
    return FoldResult::Appended;
}

size_t MessageReconciler::pendingCount() const {
    return static_cast<size_t>(
        std::count_if(m_messages.begin(), m_messages.end(), [](const Message &m) { return m.isPending(); }));
}

bool MessageReconciler::parse(const nlohmann::json &payload, Message &out) const {
    try {
        out = Message::fromJson(payload, m_mediaBase);
        return true;
    } catch (const std::exception &e) {
        Logger::warn(std::string("Reconciler: dropping malformed message: ") + e.what());
        return false;
    }
}

bool MessageReconciler::admit(Message &message, FoldResult &rejected) const {
    if (!message.hasParties()) {
        Logger::warn("Reconciler: dropping message without sender or receiver");
        rejected = FoldResult::Dropped;
        return false;
    }
    if (!inConversation(message)) {
        rejected = FoldResult::Ignored;
        return false;
    }
    if (Sanitizer::containsMarkup(message.content)) {
        message.content = Sanitizer::stripMarkup(message.content);
    }
    return true;
}

bool MessageReconciler::inConversation(const Message &message) const {
    if (m_selfId == 0 || m_peerId == 0) {
        return true;
    }
    return (message.senderId == m_selfId && message.receiverId == m_peerId) ||
           (message.senderId == m_peerId && message.receiverId == m_selfId);
}

std::vector<Message>::iterator MessageReconciler::findServerId(const MessageId &id) {
    return std::find_if(m_messages.begin(), m_messages.end(),
                        [&id](const Message &m) { return m.id.isServer() && m.id == id; });
}

std::vector<Message>::iterator MessageReconciler::findAwaitingEcho(const Message &echo) {
    return std::find_if(m_messages.begin(), m_messages.end(), [this, &echo](const Message &m) {
        return m.id.isServer() && m_awaitingEcho.count(m.id.value()) && m.senderId == echo.senderId &&
               m.content == echo.content;
    });
}

// Completion won the race; take the server's time and files from the echo
void MessageReconciler::absorbEcho(Message &row, Message &echo) {
    if (!m_awaitingEcho.erase(row.id.value())) {
        return;
    }
    if (echo.hasServerTime) {
        row.sentTime = echo.sentTime;
        row.hasServerTime = true;
    }
    if (!echo.attachments.empty()) {
        row.attachments = std::move(echo.attachments);
    }
    notify();
}

bool MessageReconciler::isDuplicateContent(const Message &message) const {
    return std::any_of(m_messages.begin(), m_messages.end(), [&message](const Message &m) {
        return !m.isPending() && m.senderId == message.senderId && m.content == message.content &&
               TimeUtils::distance(m.sentTime, message.sentTime) <= kDuplicateWindow;
    });
}

void MessageReconciler::notify() {
    if (m_onChange) {
        m_onChange();
    }
}
