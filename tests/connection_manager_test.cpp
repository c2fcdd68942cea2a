#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "net/ConnectionManager.h"
#include "support/Check.h"
#include "support/FakeTransport.h"
#include "support/ManualEventLoop.h"
#include "utils/Logger.h"

namespace {

using State = ConnectionManager::ConnectionState;
using namespace std::chrono_literals;

ConnectionManager::Options TestOptions() {
    ConnectionManager::Options options;
    options.url = "wss://chat.test/chatHub";
    return options;
}

int connectTests() {
    ManualEventLoop loop;
    FakeTransport transport(loop);
    ConnectionManager manager(loop, transport, TestOptions());

    std::vector<State> states;
    auto stateSub = manager.onStateChange([&states](State s) { states.push_back(s); });

    int firstDone = 0;
    int secondDone = 0;
    manager.ensureConnected("token-1", [&firstDone](bool ok) { firstDone = ok ? 1 : -1; });
    if (manager.state() != State::Connecting) {
        FAIL();
    }
    // Joins the attempt in progress
    manager.ensureConnected("token-1", [&secondDone](bool ok) { secondDone = ok ? 1 : -1; });

    loop.runPending();

    if (!manager.isConnected() || firstDone != 1 || secondDone != 1 || transport.openCount != 1) {
        FAIL();
    }
    if (transport.lastToken != "token-1" || transport.lastUrl != "wss://chat.test/chatHub") {
        FAIL();
    }
    if (transport.records.empty() || transport.records[0] != R"({"protocol":"json","version":1})") {
        FAIL();
    }
    if (states != std::vector<State>{State::Connecting, State::Connected}) {
        FAIL();
    }

    bool syncDone = false;
    manager.ensureConnected("token-1", [&syncDone](bool ok) { syncDone = ok; });
    if (!syncDone || transport.openCount != 1) {
        FAIL();
    }

    manager.disconnect();
    manager.disconnect();
    if (manager.state() != State::Disconnected || states.size() != 3 || transport.isOpen() ||
        transport.closeCount != 1) {
        FAIL();
    }
    // Neither the retry nor the liveness tick stays armed
    if (loop.timerCount() != 0) {
        FAIL();
    }

    // No retry after an explicit disconnect
    loop.advance(2min);
    if (transport.openCount != 1) {
        FAIL();
    }

    int noCredential = 0;
    manager.ensureConnected("", [&noCredential](bool ok) { noCredential = ok ? 1 : -1; });
    if (noCredential != -1 || transport.openCount != 1) {
        FAIL();
    }
    return 0;
}

int sendTests() {
    ManualEventLoop loop;
    FakeTransport transport(loop);
    ConnectionManager manager(loop, transport, TestOptions());

    ConnectionManager::SendOutcome outcome;
    int calls = 0;
    manager.send(5, "early", {}, nullptr, [&](const ConnectionManager::SendOutcome &o) {
        outcome = o;
        ++calls;
    });
    if (calls != 1 || outcome.error != SendError::NotConnected || !transport.invocations().empty()) {
        FAIL();
    }

    manager.ensureConnected("token");
    loop.runPending();

    std::vector<int> progress;
    calls = 0;
    EncodedAttachment file{"a.png", "Zm9v", "image/png"};
    manager.send(
        5, "Hello", {file}, [&progress](int p) { progress.push_back(p); },
        [&](const ConnectionManager::SendOutcome &o) {
            outcome = o;
            ++calls;
        });

    if (progress != std::vector<int>{10, 50} || calls != 0 || manager.inFlightCount() != 1) {
        FAIL();
    }

    const auto invocations = transport.invocations();
    if (invocations.size() != 1 || invocations[0].target != "SendMessage") {
        FAIL();
    }
    const auto &args = invocations[0].arguments;
    if (args.size() != 3 || args[0] != 5 || args[1] != "Hello" || args[2].size() != 1 ||
        args[2][0]["FileName"] != "a.png" || args[2][0]["ContentType"] != "image/png" ||
        args[2][0]["Base64Content"] != "Zm9v") {
        FAIL();
    }

    transport.complete(transport.lastInvocationId(), 42);
    loop.runPending();
    if (calls != 1 || outcome.error != SendError::None || outcome.serverId != MessageId::server("42") ||
        progress.back() != 100 || manager.inFlightCount() != 0) {
        FAIL();
    }

    // Null result: accepted without an id
    manager.send(5, "no id", {}, nullptr, [&](const ConnectionManager::SendOutcome &o) { outcome = o; });
    transport.complete(transport.lastInvocationId(), nullptr);
    loop.runPending();
    if (outcome.error != SendError::None || !outcome.serverId.isNone()) {
        FAIL();
    }

    manager.send(5, "to nobody", {}, nullptr, [&](const ConnectionManager::SendOutcome &o) { outcome = o; });
    transport.completeWithError(transport.lastInvocationId(), "Receiver not found");
    loop.runPending();
    if (outcome.error != SendError::ServerError || outcome.detail != "Receiver not found" || !manager.isConnected()) {
        FAIL();
    }

    // A failed write fails the send and drops the channel
    transport.failSends = true;
    manager.send(5, "lost", {}, nullptr, [&](const ConnectionManager::SendOutcome &o) { outcome = o; });
    if (outcome.error != SendError::TransportFailure || manager.isConnected()) {
        FAIL();
    }
    return 0;
}

int dispatchTests() {
    ManualEventLoop loop;
    FakeTransport transport(loop);
    ConnectionManager manager(loop, transport, TestOptions());

    std::vector<std::string> calls;
    ConnectionManager::Subscription second;

    auto first = manager.onEvent(ConnectionManager::EventKind::MessageReceived, [&](const nlohmann::json &payload) {
        calls.push_back("first:" + payload.value("message", ""));
        if (payload.value("message", "") == "stop") {
            second.reset();
        }
    });
    second = manager.onEvent(ConnectionManager::EventKind::MessageReceived,
                             [&](const nlohmann::json &payload) { calls.push_back("second:" + payload.value("message", "")); });
    auto thrower = manager.onEvent(ConnectionManager::EventKind::MessageReceived,
                                   [](const nlohmann::json &) { throw std::runtime_error("handler bug"); });
    auto last = manager.onEvent(ConnectionManager::EventKind::MessageReceived,
                                [&](const nlohmann::json &payload) { calls.push_back("last:" + payload.value("message", "")); });

    ConnectionManager::Subscription selfRemoving;
    int selfCalls = 0;
    selfRemoving = manager.onEvent(ConnectionManager::EventKind::MessageSent, [&](const nlohmann::json &) {
        ++selfCalls;
        selfRemoving.reset();
    });

    manager.ensureConnected("token");
    loop.runPending();

    transport.push("ReceiveMessage", {{"message", "one"}});
    transport.push("MessageSent", {{"message", "mine"}});
    transport.push("MessageSent", {{"message", "mine again"}});
    transport.push("SomethingElse", {{"message", "ignored"}});
    loop.runPending();

    if (calls != std::vector<std::string>{"first:one", "second:one", "last:one"} || selfCalls != 1) {
        FAIL();
    }

    calls.clear();
    transport.push("ReceiveMessage", {{"message", "stop"}});
    transport.push("ReceiveMessage", {{"message", "after"}});
    loop.runPending();

    if (calls != std::vector<std::string>{"first:stop", "last:stop", "first:after", "last:after"}) {
        FAIL();
    }

    manager.offEvent(last.id());
    thrower.reset();
    calls.clear();
    transport.push("ReceiveMessage", {{"message", "quiet"}});
    loop.runPending();
    if (calls != std::vector<std::string>{"first:quiet"}) {
        FAIL();
    }

    // Several records in one transport message, one of them malformed
    calls.clear();
    transport.deliverText(HubProtocol::invocation("ReceiveMessage", nlohmann::json::array({nlohmann::json{{"message", "a"}}}),
                                                  std::nullopt) +
                          std::string("not json") + HubProtocol::kRecordSeparator +
                          HubProtocol::invocation("ReceiveMessage", nlohmann::json::array({nlohmann::json{{"message", "b"}}}),
                                                  std::nullopt));
    loop.runPending();
    if (calls != std::vector<std::string>{"first:a", "first:b"}) {
        FAIL();
    }
    return 0;
}

int reconnectTests() {
    ManualEventLoop loop;
    FakeTransport transport(loop);
    ConnectionManager manager(loop, transport, TestOptions());

    manager.ensureConnected("token");
    loop.runPending();

    ConnectionManager::SendOutcome outcome;
    manager.send(5, "in flight", {}, nullptr, [&](const ConnectionManager::SendOutcome &o) { outcome = o; });

    transport.drop("network down");
    loop.runPending();
    if (manager.state() != State::Disconnected || outcome.error != SendError::ConnectionClosed) {
        FAIL();
    }

    loop.advance(4s);
    if (transport.openCount != 1) {
        FAIL();
    }
    loop.advance(1s);
    if (transport.openCount != 2 || !manager.isConnected()) {
        FAIL();
    }

    // Server close frame
    transport.serverClose("Server shutting down");
    loop.runPending();
    if (manager.isConnected()) {
        FAIL();
    }
    loop.advance(5s);
    if (!manager.isConnected() || transport.openCount != 3) {
        FAIL();
    }

    // Unbounded retries while the server refuses
    transport.drop("gone");
    transport.acceptConnections = false;
    loop.runPending();
    for (int i = 0; i < 8; ++i) {
        loop.advance(5s);
    }
    if (transport.openCount != 3 + 8 || manager.isConnected()) {
        FAIL();
    }

    transport.acceptConnections = true;
    loop.advance(5s);
    if (!manager.isConnected()) {
        FAIL();
    }
    return 0;
}

int handshakeTests() {
    ManualEventLoop loop;
    FakeTransport transport(loop);
    ConnectionManager manager(loop, transport, TestOptions());

    transport.handshakeError = std::string("Requested protocol 'json' is not available.");
    int done = 0;
    manager.ensureConnected("token", [&done](bool ok) { done = ok ? 1 : -1; });
    loop.runPending();
    if (done != -1 || manager.state() != State::Disconnected || transport.isOpen()) {
        FAIL();
    }

    transport.handshakeError.reset();
    loop.advance(5s);
    if (!manager.isConnected()) {
        FAIL();
    }

    // A handshake that never completes is abandoned by the liveness check
    ManualEventLoop slowLoop;
    FakeTransport silent(slowLoop);
    silent.answerHandshake = false;
    ConnectionManager slow(slowLoop, silent, TestOptions());
    slow.ensureConnected("token");
    slowLoop.runPending();
    if (slow.state() != State::Connecting) {
        FAIL();
    }
    slowLoop.advance(30s);
    if (slow.state() != State::Disconnected) {
        FAIL();
    }
    silent.answerHandshake = true;
    slowLoop.advance(5s);
    if (!slow.isConnected() || silent.openCount != 2) {
        FAIL();
    }
    return 0;
}

int livenessTests() {
    ManualEventLoop loop;
    FakeTransport transport(loop);
    ConnectionManager manager(loop, transport, TestOptions());

    manager.ensureConnected("token");
    loop.runPending();

    loop.advance(30s);
    if (!manager.isConnected() || transport.pingCount() != 1) {
        FAIL();
    }

    // Traffic from the server keeps the channel alive
    transport.deliverText(HubProtocol::ping());
    loop.advance(30s);
    transport.deliverText(HubProtocol::ping());
    loop.advance(30s);
    if (!manager.isConnected() || transport.pingCount() != 3) {
        FAIL();
    }

    // Silence for longer than the server timeout is a dead channel
    loop.advance(30s);
    loop.advance(30s);
    if (manager.isConnected()) {
        FAIL();
    }
    const int opensBefore = transport.openCount;
    loop.advance(5s);
    if (!manager.isConnected() || transport.openCount != opensBefore + 1) {
        FAIL();
    }
    return 0;
}

} // namespace

int main() {
    Logger::setLevel(Logger::Level::NONE);

    if (connectTests() != 0)
        return 1;
    if (sendTests() != 0)
        return 1;
    if (dispatchTests() != 0)
        return 1;
    if (reconnectTests() != 0)
        return 1;
    if (handshakeTests() != 0)
        return 1;
    if (livenessTests() != 0)
        return 1;
    return 0;
}
