#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "models/Message.h"

class HistoryProvider {
  public:
    using HistoryCallback = std::function<void(std::vector<Message>)>;
    using ErrorCallback = std::function<void(int httpCode, const std::string &error)>;

    virtual ~HistoryProvider() = default;

    /**
     * @brief Fetch the conversation with another user, oldest first
     * Exactly one of the callbacks is invoked, on the event loop.
     */
    virtual void getChatHistory(int64_t otherPartyId, HistoryCallback onSuccess, ErrorCallback onError) = 0;
};
