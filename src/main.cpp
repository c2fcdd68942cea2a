#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#endif

#include <FL/Fl.H>
#include <FL/Fl_Window.H>

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

#include "net/ApiClient.h"
#include "net/ConnectionManager.h"
#include "net/CredentialProvider.h"
#include "net/WebSocketTransport.h"
#include "screens/ConversationScreen.h"
#include "ui/Theme.h"
#include "utils/Config.h"
#include "utils/EventLoop.h"
#include "utils/Keyring.h"
#include "utils/Logger.h"

const int INITIAL_WINDOW_WIDTH = 720;
const int INITIAL_WINDOW_HEIGHT = 640;

int main(int argc, char **argv) {
    if (argc < 2) {
        Logger::error(std::string("usage: ") + argv[0] + " <peer-user-id>");
        return 2;
    }

    int64_t peerId = 0;
    try {
        size_t consumed = 0;
        peerId = std::stoll(argv[1], &consumed);
        if (consumed != std::string(argv[1]).size() || peerId <= 0) {
            throw std::invalid_argument(argv[1]);
        }
    } catch (const std::exception &) {
        Logger::error(std::string("Invalid peer user id: ") + argv[1]);
        return 2;
    }

    Fl::lock();

    AppConfig config = Config::load();
    Logger::setLevel(config.logLevel);
    Logger::info("Chatline started");

    KeyringCredentialProvider credentials;
    if (config.token) {
        if (!Keyring::set(credentials.key(), *config.token)) {
            Logger::warn("Could not store CHATLINE_TOKEN in the keyring");
        }
    }

    init_theme();

    FltkEventLoop loop;
    WebSocketTransport transport(loop);

    ConnectionManager::Options connectionOptions;
    connectionOptions.url = config.hubUrl();
    connectionOptions.retryDelay = config.retryDelay;
    connectionOptions.healthCheckInterval = config.healthCheckInterval;
    connectionOptions.serverTimeout = config.serverTimeout;
    connectionOptions.handshakeTimeout = config.handshakeTimeout;
    ConnectionManager connection(loop, transport, connectionOptions);

    Chatline::ApiClient api(loop, credentials, config);

    auto stateSub = connection.onStateChange([](ConnectionManager::ConnectionState state) {
        if (state == ConnectionManager::ConnectionState::Disconnected) {
            Logger::warn("Chat hub disconnected");
        } else {
            Logger::info(std::string("Chat hub ") + toString(state));
        }
    });

    ConversationSession::Options sessionOptions;
    sessionOptions.mediaBase = config.mediaBase();
    sessionOptions.maxAttachmentBytes = config.maxAttachmentBytes;

    int rc = 0;
    {
        Fl_Window window(INITIAL_WINDOW_WIDTH, INITIAL_WINDOW_HEIGHT, "Chatline");
        window.begin();
        auto *screen = new ConversationScreen(0, 0, window.w(), window.h(), connection, api, credentials, peerId,
                                              sessionOptions);
        window.end();
        window.resizable(screen);
        window.size_range(400, 300);
        window.show(argc, argv);

        screen->onEnter();
        rc = Fl::run();
        screen->onLeave();
    }

    stateSub.reset();
    connection.disconnect();
    return rc;
}
