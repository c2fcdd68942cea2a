#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/Message.h"
#include "models/SendResult.h"
#include "net/HubProtocol.h"
#include "net/Transport.h"
#include "utils/AttachmentEncoder.h"
#include "utils/EventLoop.h"

/**
 * @brief Owns the persistent connection to the chat hub
 *
 * One instance per application, passed by reference to every conversation. All
 * members must be called on the event loop.
 */
class ConnectionManager {
  public:
    using Json = nlohmann::json;
    using SubId = uint64_t;

    enum class ConnectionState { Disconnected, Connecting, Connected };
    enum class EventKind { MessageReceived, MessageSent };

    using EventHandler = std::function<void(const Json &)>;
    using ConnectionStateHandler = std::function<void(ConnectionState)>;
    using ConnectedCallback = std::function<void(bool connected)>;
    using ProgressCallback = std::function<void(int percent)>;

    struct SendOutcome {
        SendError error = SendError::None;
        std::string detail;
        MessageId serverId; ///< None when the server accepted without an id
    };
    using SendCallback = std::function<void(const SendOutcome &)>;

    struct Subscription {
        Subscription() = default;
        Subscription(ConnectionManager *manager, SubId id) : m_manager(manager), m_id(id) {}

        Subscription(const Subscription &) = delete;
        Subscription &operator=(const Subscription &) = delete;

        Subscription(Subscription &&other) noexcept { *this = std::move(other); }
        Subscription &operator=(Subscription &&other) noexcept {
            if (this != &other) {
                reset();
                m_manager = other.m_manager;
                m_id = other.m_id;
                other.m_manager = nullptr;
                other.m_id = 0;
            }
            return *this;
        }

        ~Subscription() { reset(); }

        void reset() {
            if (m_manager && m_id)
                m_manager->unsubscribe(m_id);
            m_manager = nullptr;
            m_id = 0;
        }

        SubId id() const { return m_id; }
        explicit operator bool() const { return m_manager != nullptr && m_id != 0; }

      private:
        ConnectionManager *m_manager = nullptr;
        SubId m_id = 0;
    };

    struct Options {
        std::string url;
        std::chrono::milliseconds retryDelay{5000};
        std::chrono::milliseconds healthCheckInterval{30000};
        std::chrono::milliseconds serverTimeout{60000};
        std::chrono::milliseconds handshakeTimeout{15000};
    };

    static constexpr const char *kReceiveTarget = "ReceiveMessage";
    static constexpr const char *kSentTarget = "MessageSent";
    static constexpr const char *kSendMethod = "SendMessage";

    ConnectionManager(EventLoop &loop, Transport &transport, Options options);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    /**
     * @brief Make sure a handshaken connection exists
     *
     * Idempotent: returns at once (calling done(true)) when connected, joins the attempt
     * in progress when connecting. A failed attempt reports done(false) and schedules a
     * retry after retryDelay; retries continue until success or disconnect().
     */
    void ensureConnected(const std::string &credential, ConnectedCallback done = nullptr);

    bool isConnected() const { return m_state == ConnectionState::Connected; }
    ConnectionState state() const { return m_state; }

    /**
     * @brief Close the channel and stop retrying; safe to call repeatedly
     */
    void disconnect();

    Subscription onEvent(EventKind kind, EventHandler handler);
    Subscription onStateChange(ConnectionStateHandler handler);
    void offEvent(SubId id) { unsubscribe(id); }
    void unsubscribe(SubId id);

    /**
     * @brief Invoke SendMessage on the hub
     *
     * Fails with NotConnected (synchronously) when there is no live channel. Progress is
     * 10 before writing, 50 once written and 100 when the server answers. Never retried.
     */
    void send(int64_t receiverId, const std::string &content, const std::vector<EncodedAttachment> &files,
              ProgressCallback onProgress, SendCallback onComplete);

    size_t inFlightCount() const { return m_invocations.size(); }

  private:
    struct Invocation {
        ProgressCallback onProgress;
        SendCallback onComplete;
    };

    void startAttempt();
    void failAttempt(const std::string &reason);
    void handleOpen();
    void handleText(const std::string &text);
    void handleFrame(const HubProtocol::Frame &frame);
    void handleCompletion(const HubProtocol::Frame &frame);
    void handleClose(const std::string &reason);
    void handleDrop(const std::string &reason);

    void setState(ConnectionState state);
    void resolveWaiters(bool connected);
    void failInFlight(SendError error, const std::string &detail);
    void scheduleRetry();
    void startHealthCheck();
    void healthCheck();

    void dispatchEvent(EventKind kind, const Json &payload);
    void notifyConnectionState(ConnectionState state);

    EventLoop &m_loop;
    Transport &m_transport;
    Options m_options;

    ConnectionState m_state = ConnectionState::Disconnected;
    std::string m_credential;
    std::vector<ConnectedCallback> m_waiters;

    bool m_handshakeDone = false;
    EventLoop::Clock::time_point m_attemptStarted{};
    EventLoop::Clock::time_point m_lastReceived{};
    HubProtocol::RecordBuffer m_records;

    EventLoop::TimerId m_retryTimer = 0;
    EventLoop::TimerId m_healthTimer = 0;

    uint64_t m_nextInvocationId = 0;
    std::unordered_map<std::string, Invocation> m_invocations;

    SubId m_nextSubId = 0;
    std::map<SubId, std::pair<EventKind, EventHandler>> m_eventSubscriptions;
    std::map<SubId, ConnectionStateHandler> m_stateSubscriptions;
};

const char *toString(ConnectionManager::ConnectionState state);
