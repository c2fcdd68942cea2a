#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "state/ConversationSession.h"
#include "support/Check.h"
#include "support/FakeTransport.h"
#include "support/Fakes.h"
#include "support/ManualEventLoop.h"
#include "utils/Logger.h"

namespace {

constexpr int64_t kSelf = 1;
constexpr int64_t kPeer = 2;

ConnectionManager::Options HubOptions() {
    ConnectionManager::Options options;
    options.url = "wss://chat.test/chatHub";
    return options;
}

// Everything a session needs, wired to in-process fakes
struct Harness {
    ManualEventLoop loop;
    FakeTransport transport{loop};
    ConnectionManager manager{loop, transport, HubOptions()};
    FakeHistoryProvider history;
    FakeCredentialProvider credentials{makeToken(kSelf)};
};

std::filesystem::path TempFile(const std::string &name, const std::string &bytes) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = std::filesystem::path{"."};
    }
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return path;
}

int activationTests() {
    Harness h;
    ConversationSession session(h.manager, h.history, h.credentials, kPeer);

    int changes = 0;
    session.setChangeHandler([&changes]() { ++changes; });

    session.activate();
    if (!session.isActive() || session.status() != ConversationStatus::Loading || session.selfId() != kSelf) {
        FAIL();
    }
    if (h.history.requests.size() != 1 || h.history.requests[0].peerId != kPeer || h.transport.openCount != 1) {
        FAIL();
    }

    // A second activate is a no-op
    session.activate();
    if (h.history.requests.size() != 1) {
        FAIL();
    }

    h.loop.runPending();
    if (session.connectionState() != ConnectionManager::ConnectionState::Connected) {
        FAIL();
    }

    h.history.respond({});
    if (session.status() != ConversationStatus::Empty || !session.lastError().empty()) {
        FAIL();
    }

    h.transport.push("ReceiveMessage", wireMessage(10, kPeer, kSelf, "Hi there", "2024-05-01T10:00:00Z"));
    h.loop.runPending();
    if (session.status() != ConversationStatus::Ready || session.messages().size() != 1 ||
        session.messages()[0].content != "Hi there") {
        FAIL();
    }
    if (changes == 0) {
        FAIL();
    }

    // Traffic for other conversations is not shown
    h.transport.push("ReceiveMessage", wireMessage(11, 3, kSelf, "Wrong chat", ""));
    h.loop.runPending();
    if (session.messages().size() != 1) {
        FAIL();
    }

    // After deactivate nothing more is folded; the connection stays up
    session.deactivate();
    h.transport.push("ReceiveMessage", wireMessage(12, kPeer, kSelf, "Too late", ""));
    h.loop.runPending();
    if (session.messages().size() != 1 || !h.manager.isConnected()) {
        FAIL();
    }
    return 0;
}

int historyTests() {
    Harness h;

    {
        ConversationSession session(h.manager, h.history, h.credentials, kPeer);
        session.activate();
        h.history.fail(500, "Internal Server Error");
        if (session.status() != ConversationStatus::Error || session.lastError() != "Internal Server Error") {
            FAIL();
        }
    }

    ConversationSession session(h.manager, h.history, h.credentials, kPeer);
    session.activate();
    session.deactivate();
    session.activate();
    if (h.history.requests.size() != 2) {
        FAIL();
    }

    // The answer to the abandoned request is ignored
    std::vector<Message> stale;
    stale.push_back(Message::fromJson(wireMessage(1, kPeer, kSelf, "stale", "2024-05-01T09:00:00Z")));
    h.history.respond(stale);
    if (session.status() != ConversationStatus::Loading || !session.messages().empty()) {
        FAIL();
    }

    std::vector<Message> rows;
    rows.push_back(Message::fromJson(wireMessage(1, kPeer, kSelf, "first", "2024-05-01T09:00:00Z")));
    rows.push_back(Message::fromJson(wireMessage(2, kSelf, kPeer, "second", "2024-05-01T09:01:00Z")));
    h.history.respond(rows);
    if (session.status() != ConversationStatus::Ready || session.messages().size() != 2) {
        FAIL();
    }

    // A session that is gone ignores its history answer
    auto doomed = std::make_unique<ConversationSession>(h.manager, h.history, h.credentials, kPeer);
    doomed->activate();
    doomed.reset();
    if (!h.history.respond(rows)) {
        FAIL();
    }
    return 0;
}

int credentialTests() {
    Harness h;
    h.credentials.token.reset();

    ConversationSession session(h.manager, h.history, h.credentials, kPeer);
    session.activate();
    if (session.isActive() || session.status() != ConversationStatus::Error || session.lastError() != "Not signed in") {
        FAIL();
    }
    if (h.transport.openCount != 0 || !h.history.requests.empty()) {
        FAIL();
    }

    h.credentials.token = makeToken(kSelf);
    session.activate();
    if (!session.isActive() || session.status() != ConversationStatus::Loading) {
        FAIL();
    }

    // Explicit self id wins over the token
    ConversationSession::Options options;
    options.selfId = 7;
    ConversationSession explicitSelf(h.manager, h.history, h.credentials, kPeer, options);
    explicitSelf.activate();
    if (explicitSelf.selfId() != 7) {
        FAIL();
    }
    return 0;
}

int validationTests() {
    Harness h;
    ConversationSession session(h.manager, h.history, h.credentials, kPeer);
    session.activate();

    // Not connected yet
    SendResult result = session.send("Hello");
    if (result.error != SendError::NotConnected || !session.messages().empty() || !result.pendingToken.empty()) {
        FAIL();
    }

    h.loop.runPending();
    h.history.respond({});

    if (session.send("<b>bold</b>").error != SendError::ContainsMarkup) {
        FAIL();
    }
    if (session.send("   \n\t").error != SendError::EmptyMessage) {
        FAIL();
    }
    if (session.send("").error != SendError::EmptyMessage) {
        FAIL();
    }

    h.credentials.token.reset();
    if (session.send("Hello").error != SendError::NotAuthenticated) {
        FAIL();
    }
    h.credentials.token = makeToken(kSelf);

    if (!session.messages().empty() || !h.transport.invocations().empty()) {
        FAIL();
    }

    ConversationSession self(h.manager, h.history, h.credentials, kSelf);
    self.activate();
    result = self.send("Note to self");
    if (result.error != SendError::SelfRecipient || std::string(describe(result.error)) != "Cannot send message to yourself") {
        FAIL();
    }
    return 0;
}

int sendFlowTests() {
    Harness h;
    ConversationSession session(h.manager, h.history, h.credentials, kPeer);
    session.activate();
    h.loop.runPending();
    h.history.respond({});

    std::vector<int> progress;
    std::optional<SendResult> delivered;
    const SendResult result = session.send(
        "  Hello  ", std::nullopt, [&delivered](const SendResult &r) { delivered = r; },
        [&progress](int p) { progress.push_back(p); });

    if (!result.ok() || result.pendingToken.empty()) {
        FAIL();
    }
    if (session.messages().size() != 1 || !session.messages()[0].isPending() ||
        session.messages()[0].content != "Hello") {
        FAIL();
    }

    const auto invocations = h.transport.invocations();
    if (invocations.size() != 1 || invocations[0].arguments[0] != kPeer || invocations[0].arguments[1] != "Hello" ||
        !invocations[0].arguments[2].empty()) {
        FAIL();
    }

    h.transport.complete(h.transport.lastInvocationId(), 42);
    h.loop.runPending();

    if (!delivered || !delivered->ok() || delivered->pendingToken != result.pendingToken ||
        !delivered->serverId || *delivered->serverId != MessageId::server("42")) {
        FAIL();
    }
    if (progress != std::vector<int>{10, 50, 100}) {
        FAIL();
    }
    if (session.messages().size() != 1 || session.messages()[0].id != MessageId::server("42")) {
        FAIL();
    }

    // The echo of the same message
    h.transport.push("MessageSent", wireMessage(42, kSelf, kPeer, "Hello", "2024-05-01T10:00:00Z"));
    h.loop.runPending();
    if (session.messages().size() != 1 || !session.messages()[0].hasServerTime) {
        FAIL();
    }

    // Echo before completion
    delivered.reset();
    session.send("Second", std::nullopt, [&delivered](const SendResult &r) { delivered = r; });
    h.transport.push("MessageSent", wireMessage(43, kSelf, kPeer, "Second", "2024-05-01T10:00:05Z"));
    h.loop.runPending();
    h.transport.complete(h.transport.lastInvocationId(), 43);
    h.loop.runPending();
    if (!delivered || !delivered->ok() || session.messages().size() != 2 ||
        session.messages()[1].id != MessageId::server("43")) {
        FAIL();
    }

    // Rejected by the server: the optimistic row goes away
    delivered.reset();
    session.send("Rejected", std::nullopt, [&delivered](const SendResult &r) { delivered = r; });
    if (session.messages().size() != 3) {
        FAIL();
    }
    h.transport.completeWithError(h.transport.lastInvocationId(), "Receiver not found");
    h.loop.runPending();
    if (!delivered || delivered->error != SendError::ServerError || delivered->detail != "Receiver not found") {
        FAIL();
    }
    if (session.messages().size() != 2) {
        FAIL();
    }

    // Connection lost while waiting for the answer
    delivered.reset();
    session.send("Lost", std::nullopt, [&delivered](const SendResult &r) { delivered = r; });
    h.transport.drop("network down");
    h.loop.runPending();
    if (!delivered || delivered->error != SendError::ConnectionClosed || session.messages().size() != 2) {
        FAIL();
    }
    if (session.connectionState() != ConnectionManager::ConnectionState::Disconnected) {
        FAIL();
    }

    // Reconnect brings the channel back without waiting for the retry
    session.reconnect();
    h.loop.runPending();
    if (session.connectionState() != ConnectionManager::ConnectionState::Connected) {
        FAIL();
    }
    return 0;
}

int attachmentTests() {
    Harness h;
    ConversationSession session(h.manager, h.history, h.credentials, kPeer);
    session.activate();
    h.loop.runPending();
    h.history.respond({});

    const auto photo = TempFile("chatline_session_photo.png", "foo");

    std::vector<int> progress;
    SendResult result = session.send("", LocalFile{photo.string(), std::nullopt, std::nullopt}, nullptr,
                                     [&progress](int p) { progress.push_back(p); });
    if (!result.ok() || result.attachmentWarning) {
        FAIL();
    }
    auto invocations = h.transport.invocations();
    if (invocations.size() != 1) {
        FAIL();
    }
    const nlohmann::json &files = invocations[0].arguments[2];
    if (files.size() != 1 || files[0]["FileName"] != "chatline_session_photo.png" ||
        files[0]["ContentType"] != "image/png" || files[0]["Base64Content"] != "Zm9v") {
        FAIL();
    }

    // Reading the file comes before the transmit milestones
    h.transport.complete(h.transport.lastInvocationId(), 7);
    h.loop.runPending();
    if (progress != std::vector<int>{0, 9, 10, 50, 100}) {
        FAIL();
    }

    const LocalFile missing{(photo.parent_path() / "chatline_session_missing.png").string(), std::nullopt,
                            std::nullopt};

    // Nothing left to send
    result = session.send("", missing);
    if (result.error != SendError::AttachmentUnreadable || result.detail.empty() || session.messages().size() != 1) {
        FAIL();
    }
    if (h.transport.invocations().size() != 1) {
        FAIL();
    }

    // Text goes out alone, with a warning
    result = session.send("Caption", missing);
    if (!result.ok() || !result.attachmentWarning || session.messages().size() != 2) {
        FAIL();
    }
    invocations = h.transport.invocations();
    if (invocations.size() != 2 || invocations[1].arguments[1] != "Caption" || !invocations[1].arguments[2].empty()) {
        FAIL();
    }

    std::error_code ec;
    std::filesystem::remove(photo, ec);
    return 0;
}

int lifetimeTests() {
    Harness h;
    auto session = std::make_unique<ConversationSession>(h.manager, h.history, h.credentials, kPeer);
    session->activate();
    h.loop.runPending();

    int completions = 0;
    session->send("In flight", std::nullopt, [&completions](const SendResult &) { ++completions; });
    session.reset();

    // Answers for a destroyed session are dropped
    h.transport.complete(h.transport.lastInvocationId(), 99);
    h.transport.push("ReceiveMessage", wireMessage(100, kPeer, kSelf, "Anyone?", ""));
    h.loop.runPending();
    if (completions != 0 || h.manager.inFlightCount() != 0 || !h.manager.isConnected()) {
        FAIL();
    }
    return 0;
}

} // namespace

int main() {
    Logger::setLevel(Logger::Level::NONE);

    if (activationTests() != 0)
        return 1;
    if (historyTests() != 0)
        return 1;
    if (credentialTests() != 0)
        return 1;
    if (validationTests() != 0)
        return 1;
    if (sendFlowTests() != 0)
        return 1;
    if (attachmentTests() != 0)
        return 1;
    if (lifetimeTests() != 0)
        return 1;
    return 0;
}
