#include "net/WebSocketTransport.h"

#include <ixwebsocket/IXNetSystem.h>

#include <cctype>
#include <cstdio>
#include <utility>

#include "utils/Logger.h"

WebSocketTransport::WebSocketTransport(EventLoop &loop) : m_loop(loop) {
    ix::initNetSystem();
    m_ws.setPingInterval(0);
    m_ws.disableAutomaticReconnection();
}

WebSocketTransport::~WebSocketTransport() {
    close();
    ix::uninitNetSystem();
}

std::string WebSocketTransport::withAccessToken(const std::string &url, const std::string &token) {
    std::string encoded;
    encoded.reserve(token.size());
    for (unsigned char c : token) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded += hex;
        }
    }
    return url + (url.find('?') == std::string::npos ? "?" : "&") + "access_token=" + encoded;
}

void WebSocketTransport::open(const std::string &url, const std::string &token, Callbacks callbacks) {
    close();

    m_callbacks = std::move(callbacks);
    const uint64_t generation = ++*m_generation;

    m_ws.setUrl(withAccessToken(url, token));
    m_ws.setOnMessageCallback([this, generation](const ix::WebSocketMessagePtr &msg) {
        switch (msg->type) {
        case ix::WebSocketMessageType::Open:
            deliver(generation, [](const Callbacks &cb) {
                if (cb.onOpen)
                    cb.onOpen();
            });
            break;

        case ix::WebSocketMessageType::Message:
            deliver(generation, [text = msg->str](const Callbacks &cb) {
                if (cb.onMessage)
                    cb.onMessage(text);
            });
            break;

        case ix::WebSocketMessageType::Close:
            deliver(
                generation,
                [reason = "closed (" + std::to_string(msg->closeInfo.code) + ") " + msg->closeInfo.reason](
                    const Callbacks &cb) {
                    if (cb.onClose)
                        cb.onClose(reason);
                },
                true);
            break;

        case ix::WebSocketMessageType::Error:
            deliver(
                generation,
                [reason = "error: " + msg->errorInfo.reason](const Callbacks &cb) {
                    if (cb.onClose)
                        cb.onClose(reason);
                },
                true);
            break;

        default:
            break;
        }
    });

    Logger::debug("WebSocketTransport: connecting to " + url);
    m_open = true;
    m_ws.start();
}

bool WebSocketTransport::send(const std::string &text) {
    if (!m_open || m_ws.getReadyState() != ix::ReadyState::Open) {
        return false;
    }
    return m_ws.sendText(text).success;
}

void WebSocketTransport::close() {
    ++*m_generation;
    if (!m_open) {
        return;
    }
    m_open = false;
    m_ws.stop();
    m_ws.setOnMessageCallback(nullptr);
}

void WebSocketTransport::deliver(uint64_t generation, std::function<void(const Callbacks &)> fn, bool terminal) {
    std::weak_ptr<uint64_t> current = m_generation;
    m_loop.post([this, current, generation, terminal, fn = std::move(fn)]() {
        auto live = current.lock();
        if (!live || *live != generation) {
            return;
        }
        // Close and Error end this generation
        if (terminal) {
            ++*live;
        }
        Callbacks callbacks = m_callbacks;
        fn(callbacks);
    });
}
