#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "support/Check.h"
#include "support/Fakes.h"
#include "utils/Base64.h"
#include "utils/Config.h"
#include "utils/Jwt.h"
#include "utils/Logger.h"
#include "utils/Uuid.h"

namespace {

int base64Tests() {
    if (Base64::encode(std::string("")) != "" || Base64::encode(std::string("f")) != "Zg==" ||
        Base64::encode(std::string("fo")) != "Zm8=" || Base64::encode(std::string("foo")) != "Zm9v" ||
        Base64::encode(std::string("foobar")) != "Zm9vYmFy") {
        FAIL();
    }

    // Chunk boundaries must not change the output
    const std::string text = "The quick brown fox jumps over the lazy dog";
    const std::string whole = Base64::encode(text);
    for (size_t split = 1; split < 7; ++split) {
        Base64::Encoder encoder;
        size_t offset = 0;
        while (offset < text.size()) {
            const size_t n = std::min(split, text.size() - offset);
            encoder.update(reinterpret_cast<const uint8_t *>(text.data()) + offset, n);
            offset += n;
        }
        if (encoder.finish() != whole) {
            FAIL();
        }
    }

    std::vector<uint8_t> decoded;
    if (!Base64::decode(whole, decoded) || std::string(decoded.begin(), decoded.end()) != text) {
        FAIL();
    }
    if (!Base64::decode("-_8", decoded) || decoded.size() != 2 || decoded[0] != 0xFB || decoded[1] != 0xFF) {
        FAIL();
    }
    if (Base64::decode("not base64!", decoded)) {
        FAIL();
    }

    return 0;
}

int jwtTests() {
    if (JwtUtils::userIdFromToken(makeToken(42)).value_or(0) != 42) {
        FAIL();
    }
    if (JwtUtils::userIdFromToken(makeToken(nlohmann::json{{"nameid", 9}})).value_or(0) != 9) {
        FAIL();
    }
    if (JwtUtils::userIdFromToken(makeToken(nlohmann::json{{"sub", "17"}, {"email", "a@b.c"}})).value_or(0) != 17) {
        FAIL();
    }
    if (JwtUtils::userIdFromToken(makeToken(nlohmann::json{{"nameid", "alice"}}))) {
        FAIL();
    }
    if (JwtUtils::userIdFromToken(makeToken(nlohmann::json{{"nameid", 0}}))) {
        FAIL();
    }
    if (JwtUtils::userIdFromToken("opaque-token")) {
        FAIL();
    }
    if (JwtUtils::decodePayload("a.b")) {
        FAIL();
    }

    auto claims = JwtUtils::decodePayload(makeToken(nlohmann::json{{"role", "Customer"}}));
    if (!claims || claims->value("role", "") != "Customer") {
        FAIL();
    }
    return 0;
}

int configTests() {
    AppConfig config;
    if (config.hubUrl() != "wss://seasondecor.azurewebsites.net/chatHub") {
        FAIL();
    }
    if (config.mediaBase() != config.baseUrl) {
        FAIL();
    }
    if (config.retryDelay != std::chrono::milliseconds(5000) ||
        config.healthCheckInterval != std::chrono::milliseconds(30000)) {
        FAIL();
    }

    Config::applyJson(config, {{"baseUrl", "http://localhost:5000/"},
                               {"retryDelayMs", 250},
                               {"serverTimeoutMs", -1},
                               {"maxAttachmentBytes", "big"},
                               {"logLevel", "debug"},
                               {"mediaBaseUrl", "https://cdn.test"},
                               {"unknownKey", true}});

    if (config.hubUrl() != "ws://localhost:5000/chatHub") {
        FAIL();
    }
    if (config.retryDelay != std::chrono::milliseconds(250)) {
        FAIL();
    }
    if (config.serverTimeout != std::chrono::milliseconds(60000)) {
        FAIL();
    }
    if (config.maxAttachmentBytes != 10u * 1024u * 1024u) {
        FAIL();
    }
    if (config.logLevel != Logger::Level::DEBUG || config.mediaBase() != "https://cdn.test") {
        FAIL();
    }

    Config::applyJson(config, nlohmann::json::array());
    if (config.retryDelay != std::chrono::milliseconds(250)) {
        FAIL();
    }
    return 0;
}

int miscTests() {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const std::string token = UuidHelper::pendingToken();
        if (token.rfind("pending:", 0) != 0 || token.size() != 8 + 36) {
            FAIL();
        }
        if (token[8 + 14] != '4') {
            FAIL();
        }
        seen.insert(token);
    }
    if (seen.size() != 100) {
        FAIL();
    }

    if (Logger::parseLevel("Warning") != Logger::Level::WARN || Logger::parseLevel("off") != Logger::Level::NONE ||
        Logger::parseLevel("verbose")) {
        FAIL();
    }

    std::vector<std::pair<Logger::Level, std::string>> lines;
    Logger::setSink([&lines](Logger::Level level, const std::string &line) { lines.emplace_back(level, line); });
    Logger::setLevel(Logger::Level::WARN);
    Logger::info("hidden");
    Logger::log(Logger::Level::WARN, "hub", "Retrying in 5000ms");
    Logger::error("boom");
    Logger::setLevel(Logger::Level::NONE);
    Logger::error("silenced");
    Logger::setSink(nullptr);
    Logger::setLevel(Logger::Level::ERROR);

    if (lines.size() != 2 || lines[0].first != Logger::Level::WARN || lines[1].first != Logger::Level::ERROR) {
        FAIL();
    }
    if (lines[0].second.find("[hub] [WARN] Retrying in 5000ms") == std::string::npos ||
        lines[0].second.find('\033') != std::string::npos) {
        FAIL();
    }
    if (lines[1].second.find("[ERROR] boom") == std::string::npos) {
        FAIL();
    }
    return 0;
}

} // namespace

int main() {
    Logger::setLevel(Logger::Level::ERROR);

    if (base64Tests() != 0)
        return 1;
    if (jwtTests() != 0)
        return 1;
    if (configTests() != 0)
        return 1;
    if (miscTests() != 0)
        return 1;
    return 0;
}
