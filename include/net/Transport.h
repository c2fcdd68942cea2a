#pragma once

#include <functional>
#include <string>

/**
 * @brief Raw text duplex channel to the chat hub
 *
 * Callbacks are delivered on the event loop. After close() (or a new open()) no
 * callback belonging to the previous session is delivered.
 */
class Transport {
  public:
    struct Callbacks {
        std::function<void()> onOpen;
        std::function<void(const std::string &text)> onMessage;
        std::function<void(const std::string &reason)> onClose; ///< Close or error, at most once per open()
    };

    virtual ~Transport() = default;

    /**
     * @brief Start connecting; the bearer token travels as the access_token query parameter
     */
    virtual void open(const std::string &url, const std::string &token, Callbacks callbacks) = 0;

    /**
     * @brief Write one text message
     * @return false if the channel is not open or the write failed
     */
    virtual bool send(const std::string &text) = 0;

    virtual void close() = 0;
};
