#include "utils/Jwt.h"

#include "utils/Base64.h"
#include "utils/Logger.h"

#include <vector>

namespace JwtUtils {

static std::optional<int64_t> claimAsId(const nlohmann::json &claims, const char *name) {
    auto it = claims.find(name);
    if (it == claims.end()) {
        return std::nullopt;
    }

    if (it->is_number_integer()) {
        int64_t value = it->get<int64_t>();
        return value > 0 ? std::optional<int64_t>(value) : std::nullopt;
    }

    if (it->is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = it->get<std::string>();
            int64_t value = std::stoll(text, &consumed);
            if (consumed == text.size() && value > 0) {
                return value;
            }
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

std::optional<nlohmann::json> decodePayload(const std::string &token) {
    const size_t first = token.find('.');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const size_t second = token.find('.', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    if (!Base64::decode(token.substr(first + 1, second - first - 1), bytes) || bytes.empty()) {
        return std::nullopt;
    }

    nlohmann::json claims = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (claims.is_discarded() || !claims.is_object()) {
        return std::nullopt;
    }
    return claims;
}

std::optional<int64_t> userIdFromToken(const std::string &token) {
    auto claims = decodePayload(token);
    if (!claims.has_value()) {
        Logger::warn("Token is not a JWT, cannot derive user id");
        return std::nullopt;
    }

    if (auto id = claimAsId(*claims, "nameid")) {
        return id;
    }
    if (auto id = claimAsId(*claims, "sub")) {
        return id;
    }

    Logger::warn("Token carries no numeric nameid/sub claim");
    return std::nullopt;
}

} // namespace JwtUtils
