#include "models/Message.h"

#include <cmath>
#include <stdexcept>

#include "utils/Time.h"

MessageId MessageId::server(std::string value) { return MessageId(Kind::Server, std::move(value)); }

MessageId MessageId::pending(std::string token) { return MessageId(Kind::Pending, std::move(token)); }

MessageId MessageId::fromJson(const nlohmann::json &j) {
    if (j.is_null()) {
        return none();
    }
    if (j.is_string()) {
        const std::string value = j.get<std::string>();
        return value.empty() ? none() : server(value);
    }
    if (j.is_number_unsigned()) {
        return server(std::to_string(j.get<uint64_t>()));
    }
    if (j.is_number_integer()) {
        return server(std::to_string(j.get<int64_t>()));
    }
    if (j.is_number_float()) {
        const double value = j.get<double>();
        if (std::floor(value) == value) {
            return server(std::to_string(static_cast<int64_t>(value)));
        }
    }
    throw std::invalid_argument("message id must be a string, an integer or null");
}

std::string MessageId::toString() const {
    switch (m_kind) {
    case Kind::Server:
        return m_value;
    case Kind::Pending:
        return m_value;
    case Kind::None:
    default:
        return "null";
    }
}

namespace {

const nlohmann::json *findAny(const nlohmann::json &j, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

int64_t readPartyId(const nlohmann::json &j, std::initializer_list<const char *> keys) {
    const nlohmann::json *value = findAny(j, keys);
    if (!value) {
        return 0;
    }
    if (value->is_number_integer()) {
        return value->get<int64_t>();
    }
    if (value->is_string()) {
        const std::string text = value->get<std::string>();
        size_t consumed = 0;
        int64_t parsed = 0;
        try {
            parsed = std::stoll(text, &consumed);
        } catch (const std::exception &) {
            throw std::invalid_argument("party id '" + text + "' is not numeric");
        }
        if (consumed != text.size()) {
            throw std::invalid_argument("party id '" + text + "' is not numeric");
        }
        return parsed;
    }
    throw std::invalid_argument("party id has an unexpected JSON type");
}

} // namespace

Message Message::fromJson(const nlohmann::json &j, const std::string &mediaBase) {
    if (!j.is_object()) {
        throw std::invalid_argument("message payload is not a JSON object");
    }

    Message message;

    if (j.contains("id")) {
        message.id = MessageId::fromJson(j["id"]);
    }

    message.senderId = readPartyId(j, {"senderId", "SenderId"});
    message.receiverId = readPartyId(j, {"receiverId", "ReceiverId"});

    if (const nlohmann::json *content = findAny(j, {"message", "content", "Message", "Content"})) {
        message.content = content->get<std::string>();
    }

    if (const nlohmann::json *sent = findAny(j, {"sentTime", "timestamp", "SentTime"})) {
        auto parsed = TimeUtils::parseISO8601(sent->get<std::string>());
        if (!parsed.has_value()) {
            throw std::invalid_argument("unparseable sentTime '" + sent->get<std::string>() + "'");
        }
        message.sentTime = *parsed;
        message.hasServerTime = true;
    } else {
        message.sentTime = std::chrono::system_clock::now();
    }

    if (const nlohmann::json *files = findAny(j, {"files", "attachments", "Files"})) {
        if (files->is_array()) {
            for (const auto &fileJson : *files) {
                if (auto attachment = Attachment::fromJson(fileJson, mediaBase)) {
                    message.attachments.push_back(std::move(*attachment));
                }
            }
        }
    }

    if (const nlohmann::json *read = findAny(j, {"isRead", "IsRead"})) {
        if (read->is_boolean()) {
            message.isRead = read->get<bool>();
        }
    }

    return message;
}
