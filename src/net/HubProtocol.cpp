#include "net/HubProtocol.h"

namespace HubProtocol {

static std::string frame(const nlohmann::json &j) {
    std::string text = j.dump();
    text.push_back(kRecordSeparator);
    return text;
}

std::string handshakeRequest() { return frame({{"protocol", kProtocolName}, {"version", kProtocolVersion}}); }

bool parseHandshakeResponse(const std::string &record, std::string &error) {
    nlohmann::json j = nlohmann::json::parse(record, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        error = "malformed handshake response";
        return false;
    }

    auto it = j.find("error");
    if (it != j.end() && !it->is_null()) {
        error = it->is_string() ? it->get<std::string>() : it->dump();
        return false;
    }
    return true;
}

std::string invocation(const std::string &target, const nlohmann::json &arguments,
                       const std::optional<std::string> &invocationId) {
    nlohmann::json j = {{"type", static_cast<int>(FrameType::Invocation)}, {"target", target}, {"arguments", arguments}};
    if (invocationId.has_value()) {
        j["invocationId"] = *invocationId;
    }
    return frame(j);
}

std::string completion(const std::string &invocationId, const nlohmann::json &result) {
    return frame(
        {{"type", static_cast<int>(FrameType::Completion)}, {"invocationId", invocationId}, {"result", result}});
}

std::string completionError(const std::string &invocationId, const std::string &error) {
    return frame({{"type", static_cast<int>(FrameType::Completion)}, {"invocationId", invocationId}, {"error", error}});
}

std::string ping() { return frame({{"type", static_cast<int>(FrameType::Ping)}}); }

std::string close(const std::optional<std::string> &error, bool allowReconnect) {
    nlohmann::json j = {{"type", static_cast<int>(FrameType::Close)}, {"allowReconnect", allowReconnect}};
    if (error.has_value()) {
        j["error"] = *error;
    }
    return frame(j);
}

bool parseFrame(const std::string &record, Frame &out) {
    nlohmann::json j = nlohmann::json::parse(record, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_number_integer()) {
        return false;
    }

    const int type = typeIt->get<int>();
    out = Frame{};
    out.type = (type >= 1 && type <= 7) ? static_cast<FrameType>(type) : FrameType::Unknown;

    auto it = j.find("invocationId");
    if (it != j.end() && it->is_string()) {
        out.invocationId = it->get<std::string>();
    }

    it = j.find("target");
    if (it != j.end() && it->is_string()) {
        out.target = it->get<std::string>();
    }

    it = j.find("arguments");
    if (it != j.end() && it->is_array()) {
        out.arguments = *it;
    }

    it = j.find("result");
    if (it != j.end()) {
        out.result = *it;
    }

    it = j.find("error");
    if (it != j.end() && !it->is_null()) {
        out.error = it->is_string() ? it->get<std::string>() : it->dump();
    }

    it = j.find("allowReconnect");
    if (it != j.end() && it->is_boolean()) {
        out.allowReconnect = it->get<bool>();
    }

    out.body = std::move(j);
    return true;
}

void RecordBuffer::append(const std::string &data) { m_buffer.append(data); }

bool RecordBuffer::next(std::string &record) {
    const size_t sep = m_buffer.find(kRecordSeparator);
    if (sep == std::string::npos) {
        return false;
    }
    record = m_buffer.substr(0, sep);
    m_buffer.erase(0, sep + 1);
    return true;
}

} // namespace HubProtocol
