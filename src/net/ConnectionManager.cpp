#include "net/ConnectionManager.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include "utils/Logger.h"

namespace {

const char *kLogPrefix = "hub";

} // namespace

const char *toString(ConnectionManager::ConnectionState state) {
    switch (state) {
    case ConnectionManager::ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionManager::ConnectionState::Connecting:
        return "connecting";
    case ConnectionManager::ConnectionState::Connected:
        return "connected";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(EventLoop &loop, Transport &transport, Options options)
    : m_loop(loop), m_transport(transport), m_options(std::move(options)) {}

ConnectionManager::~ConnectionManager() { disconnect(); }

void ConnectionManager::ensureConnected(const std::string &credential, ConnectedCallback done) {
    if (credential.empty()) {
        Logger::log(Logger::Level::WARN, kLogPrefix, "No credential, not connecting");
        if (done)
            done(false);
        return;
    }

    m_credential = credential;
    startHealthCheck();

    if (m_state == ConnectionState::Connected) {
        if (done)
            done(true);
        return;
    }

    if (done)
        m_waiters.push_back(std::move(done));

    if (m_state == ConnectionState::Connecting)
        return;

    if (m_retryTimer) {
        m_loop.cancel(m_retryTimer);
        m_retryTimer = 0;
    }
    startAttempt();
}

void ConnectionManager::disconnect() {
    if (m_retryTimer) {
        m_loop.cancel(m_retryTimer);
        m_retryTimer = 0;
    }
    if (m_healthTimer) {
        m_loop.cancel(m_healthTimer);
        m_healthTimer = 0;
    }
    m_credential.clear();
    m_transport.close();
    m_records.clear();

    if (m_state == ConnectionState::Disconnected && m_waiters.empty() && m_invocations.empty())
        return;

    Logger::log(Logger::Level::INFO, kLogPrefix, "Disconnecting");
    setState(ConnectionState::Disconnected);
    failInFlight(SendError::ConnectionClosed, "disconnected");
    resolveWaiters(false);
}

ConnectionManager::Subscription ConnectionManager::onEvent(EventKind kind, EventHandler handler) {
    const auto id = ++m_nextSubId;
    m_eventSubscriptions.emplace(id, std::make_pair(kind, std::move(handler)));
    return Subscription(this, id);
}

ConnectionManager::Subscription ConnectionManager::onStateChange(ConnectionStateHandler handler) {
    const auto id = ++m_nextSubId;
    m_stateSubscriptions.emplace(id, std::move(handler));
    return Subscription(this, id);
}

void ConnectionManager::unsubscribe(SubId id) {
    m_eventSubscriptions.erase(id);
    m_stateSubscriptions.erase(id);
}

void ConnectionManager::send(int64_t receiverId, const std::string &content,
                             const std::vector<EncodedAttachment> &files, ProgressCallback onProgress,
                             SendCallback onComplete) {
    if (m_state != ConnectionState::Connected) {
        if (onComplete)
            onComplete(SendOutcome{SendError::NotConnected, "not connected", MessageId::none()});
        return;
    }

    if (onProgress)
        onProgress(10);

    Json filesJson = Json::array();
    for (const auto &file : files) {
        filesJson.push_back(
            {{"FileName", file.fileName}, {"ContentType", file.contentType}, {"Base64Content", file.encodedContent}});
    }

    const std::string invocationId = std::to_string(++m_nextInvocationId);
    const std::string frame =
        HubProtocol::invocation(kSendMethod, Json::array({receiverId, content, filesJson}), invocationId);

    m_invocations.emplace(invocationId, Invocation{onProgress, std::move(onComplete)});

    if (!m_transport.send(frame)) {
        auto it = m_invocations.find(invocationId);
        if (it != m_invocations.end()) {
            Invocation failed = std::move(it->second);
            m_invocations.erase(it);
            if (failed.onComplete)
                failed.onComplete(SendOutcome{SendError::TransportFailure, "write failed", MessageId::none()});
        }
        handleDrop("write failed");
        return;
    }

    Logger::log(Logger::Level::DEBUG, kLogPrefix,
                "Invocation " + invocationId + " sent (" + std::to_string(files.size()) + " file(s))");

    auto it = m_invocations.find(invocationId);
    if (it != m_invocations.end() && it->second.onProgress)
        it->second.onProgress(50);
}

void ConnectionManager::startAttempt() {
    Logger::log(Logger::Level::INFO, kLogPrefix, "Connecting to " + m_options.url);

    m_handshakeDone = false;
    m_records.clear();
    m_attemptStarted = m_loop.now();
    setState(ConnectionState::Connecting);

    Transport::Callbacks callbacks;
    callbacks.onOpen = [this]() { handleOpen(); };
    callbacks.onMessage = [this](const std::string &text) { handleText(text); };
    callbacks.onClose = [this](const std::string &reason) { handleClose(reason); };

    m_transport.open(m_options.url, m_credential, std::move(callbacks));
}

void ConnectionManager::failAttempt(const std::string &reason) {
    Logger::log(Logger::Level::WARN, kLogPrefix, "Connection attempt failed: " + reason);

    m_transport.close();
    m_records.clear();
    setState(ConnectionState::Disconnected);
    resolveWaiters(false);
    scheduleRetry();
}

void ConnectionManager::handleOpen() {
    if (m_state != ConnectionState::Connecting)
        return;

    if (!m_transport.send(HubProtocol::handshakeRequest())) {
        failAttempt("handshake write failed");
    }
}

void ConnectionManager::handleText(const std::string &text) {
    m_lastReceived = m_loop.now();
    m_records.append(text);

    std::string record;
    while (m_records.next(record)) {
        if (!m_handshakeDone) {
            std::string error;
            if (!HubProtocol::parseHandshakeResponse(record, error)) {
                failAttempt("handshake rejected: " + error);
                return;
            }

            m_handshakeDone = true;
            Logger::log(Logger::Level::INFO, kLogPrefix, "Connected");
            setState(ConnectionState::Connected);
            resolveWaiters(true);

            // A waiter may have disconnected
            if (m_state != ConnectionState::Connected)
                return;
            continue;
        }

        HubProtocol::Frame frame;
        if (!HubProtocol::parseFrame(record, frame)) {
            Logger::log(Logger::Level::WARN, kLogPrefix, "Dropping malformed frame");
            continue;
        }

        handleFrame(frame);
        if (m_state != ConnectionState::Connected)
            return;
    }
}

void ConnectionManager::handleFrame(const HubProtocol::Frame &frame) {
    switch (frame.type) {
    case HubProtocol::FrameType::Invocation: {
        if (frame.target != kReceiveTarget && frame.target != kSentTarget) {
            Logger::log(Logger::Level::DEBUG, kLogPrefix, "Ignoring invocation of " + frame.target);
            break;
        }
        if (frame.arguments.empty()) {
            Logger::log(Logger::Level::WARN, kLogPrefix, frame.target + " without arguments");
            break;
        }
        const EventKind kind = frame.target == kReceiveTarget ? EventKind::MessageReceived : EventKind::MessageSent;
        dispatchEvent(kind, frame.arguments.at(0));
        break;
    }

    case HubProtocol::FrameType::Completion:
        handleCompletion(frame);
        break;

    case HubProtocol::FrameType::Ping:
        break;

    case HubProtocol::FrameType::Close:
        handleDrop("server closed the connection" + (frame.error ? ": " + *frame.error : std::string()));
        break;

    default:
        Logger::log(Logger::Level::DEBUG, kLogPrefix,
                    "Ignoring frame of type " + std::to_string(static_cast<int>(frame.type)));
        break;
    }
}

void ConnectionManager::handleCompletion(const HubProtocol::Frame &frame) {
    if (!frame.invocationId)
        return;

    auto it = m_invocations.find(*frame.invocationId);
    if (it == m_invocations.end()) {
        Logger::log(Logger::Level::DEBUG, kLogPrefix, "Completion for unknown invocation " + *frame.invocationId);
        return;
    }

    Invocation invocation = std::move(it->second);
    m_invocations.erase(it);

    SendOutcome outcome;
    if (frame.error) {
        outcome.error = SendError::ServerError;
        outcome.detail = *frame.error;
    } else {
        try {
            outcome.serverId = MessageId::fromJson(frame.result);
        } catch (const std::invalid_argument &e) {
            Logger::log(Logger::Level::WARN, kLogPrefix, std::string("Unexpected completion result: ") + e.what());
            outcome.serverId = MessageId::none();
        }
        Logger::log(Logger::Level::DEBUG, kLogPrefix,
                    "Invocation " + *frame.invocationId + " completed, id " + outcome.serverId.toString());
    }

    if (invocation.onProgress)
        invocation.onProgress(100);
    if (invocation.onComplete)
        invocation.onComplete(outcome);
}

void ConnectionManager::handleClose(const std::string &reason) {
    if (m_state == ConnectionState::Connecting) {
        failAttempt(reason);
    } else if (m_state == ConnectionState::Connected) {
        handleDrop(reason);
    }
}

void ConnectionManager::handleDrop(const std::string &reason) {
    if (m_state == ConnectionState::Disconnected)
        return;
    if (m_state == ConnectionState::Connecting) {
        failAttempt(reason);
        return;
    }

    Logger::log(Logger::Level::WARN, kLogPrefix, "Connection lost: " + reason);

    m_transport.close();
    m_records.clear();
    setState(ConnectionState::Disconnected);
    failInFlight(SendError::ConnectionClosed, reason);
    scheduleRetry();
}

void ConnectionManager::setState(ConnectionState state) {
    if (m_state == state)
        return;
    m_state = state;
    notifyConnectionState(state);
}

void ConnectionManager::resolveWaiters(bool connected) {
    std::vector<ConnectedCallback> waiters;
    waiters.swap(m_waiters);
    for (auto &waiter : waiters) {
        waiter(connected);
    }
}

void ConnectionManager::failInFlight(SendError error, const std::string &detail) {
    std::unordered_map<std::string, Invocation> invocations;
    invocations.swap(m_invocations);
    for (auto &kv : invocations) {
        if (kv.second.onComplete)
            kv.second.onComplete(SendOutcome{error, detail, MessageId::none()});
    }
}

void ConnectionManager::scheduleRetry() {
    if (m_credential.empty() || m_retryTimer)
        return;

    Logger::log(Logger::Level::INFO, kLogPrefix,
                "Retrying in " + std::to_string(m_options.retryDelay.count()) + "ms");

    m_retryTimer = m_loop.schedule(m_options.retryDelay, [this]() {
        m_retryTimer = 0;
        if (!m_credential.empty() && m_state == ConnectionState::Disconnected)
            ensureConnected(m_credential);
    });
}

void ConnectionManager::startHealthCheck() {
    if (m_healthTimer)
        return;
    m_healthTimer = m_loop.schedule(m_options.healthCheckInterval, [this]() {
        m_healthTimer = 0;
        healthCheck();
        startHealthCheck();
    });
}

void ConnectionManager::healthCheck() {
    const auto now = m_loop.now();

    switch (m_state) {
    case ConnectionState::Connecting:
        if (now - m_attemptStarted > m_options.handshakeTimeout)
            failAttempt("handshake timed out");
        break;

    case ConnectionState::Connected:
        if (now - m_lastReceived > m_options.serverTimeout) {
            handleDrop("no traffic from server");
        } else if (!m_transport.send(HubProtocol::ping())) {
            handleDrop("ping failed");
        }
        break;

    case ConnectionState::Disconnected:
        if (!m_credential.empty() && !m_retryTimer) {
            Logger::log(Logger::Level::INFO, kLogPrefix, "Liveness check found no connection, reconnecting");
            ensureConnected(m_credential);
        }
        break;
    }
}

void ConnectionManager::dispatchEvent(EventKind kind, const Json &payload) {
    std::vector<SubId> ids;
    ids.reserve(m_eventSubscriptions.size());
    for (const auto &kv : m_eventSubscriptions) {
        if (kv.second.first == kind)
            ids.push_back(kv.first);
    }

    for (SubId id : ids) {
        auto it = m_eventSubscriptions.find(id);
        if (it == m_eventSubscriptions.end())
            continue;

        EventHandler handler = it->second.second;
        try {
            handler(payload);
        } catch (const std::exception &e) {
            Logger::log(Logger::Level::ERROR, kLogPrefix, std::string("Event handler threw: ") + e.what());
        }
    }
}

void ConnectionManager::notifyConnectionState(ConnectionState state) {
    std::vector<SubId> ids;
    ids.reserve(m_stateSubscriptions.size());
    for (const auto &kv : m_stateSubscriptions) {
        ids.push_back(kv.first);
    }

    for (SubId id : ids) {
        auto it = m_stateSubscriptions.find(id);
        if (it == m_stateSubscriptions.end())
            continue;

        ConnectionStateHandler handler = it->second;
        try {
            handler(state);
        } catch (const std::exception &e) {
            Logger::log(Logger::Level::ERROR, kLogPrefix, std::string("State handler threw: ") + e.what());
        }
    }
}
