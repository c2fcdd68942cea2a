#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <ixwebsocket/IXWebSocket.h>

#include "net/Transport.h"
#include "utils/EventLoop.h"

class WebSocketTransport : public Transport {
  public:
    explicit WebSocketTransport(EventLoop &loop);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport &) = delete;
    WebSocketTransport &operator=(const WebSocketTransport &) = delete;

    void open(const std::string &url, const std::string &token, Callbacks callbacks) override;
    bool send(const std::string &text) override;
    void close() override;

    static std::string withAccessToken(const std::string &url, const std::string &token);

  private:
    void deliver(uint64_t generation, std::function<void(const Callbacks &)> fn, bool terminal = false);

    EventLoop &m_loop;
    ix::WebSocket m_ws;
    Callbacks m_callbacks;
    bool m_open = false;

    // Bumped on every open()/close(); callbacks posted for an older generation are dropped
    std::shared_ptr<uint64_t> m_generation = std::make_shared<uint64_t>(0);
};
