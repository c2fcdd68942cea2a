#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace HubProtocol {

constexpr char kRecordSeparator = '\x1e';
constexpr const char *kProtocolName = "json";
constexpr int kProtocolVersion = 1;

enum class FrameType {
    Unknown = 0,
    Invocation = 1,
    StreamItem = 2,
    Completion = 3,
    StreamInvocation = 4,
    CancelInvocation = 5,
    Ping = 6,
    Close = 7
};

struct Frame {
    FrameType type = FrameType::Unknown;
    nlohmann::json body; ///< The whole decoded record

    // Invocation
    std::string target;
    nlohmann::json arguments = nlohmann::json::array();

    // Invocation / Completion
    std::optional<std::string> invocationId;

    // Completion / Close
    nlohmann::json result;
    std::optional<std::string> error;

    // Close
    bool allowReconnect = false;
};

std::string handshakeRequest();

/**
 * @brief Check a handshake response record
 * @return true if the server accepted the protocol; otherwise `error` holds the reason
 */
bool parseHandshakeResponse(const std::string &record, std::string &error);

std::string invocation(const std::string &target, const nlohmann::json &arguments,
                       const std::optional<std::string> &invocationId);
std::string completion(const std::string &invocationId, const nlohmann::json &result);
std::string completionError(const std::string &invocationId, const std::string &error);
std::string ping();
std::string close(const std::optional<std::string> &error, bool allowReconnect);

/**
 * @brief Decode one record (without its separator)
 * @return false if the record is not a JSON object with a numeric "type"
 */
bool parseFrame(const std::string &record, Frame &out);

/**
 * @brief Splits an incoming text stream into records
 * A WebSocket message may carry several records, or a record may span messages.
 */
class RecordBuffer {
  public:
    void append(const std::string &data);

    /**
     * @brief Pop the next complete record
     * @return false when no complete record is buffered
     */
    bool next(std::string &record);

    void clear() { m_buffer.clear(); }
    bool empty() const { return m_buffer.empty(); }

  private:
    std::string m_buffer;
};

} // namespace HubProtocol
