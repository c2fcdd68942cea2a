#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace JwtUtils {

/**
 * @brief Decode the payload segment of a JWT without verifying its signature
 * @return Claims object, or std::nullopt if the token is not a well-formed JWT
 */
std::optional<nlohmann::json> decodePayload(const std::string &token);

/**
 * @brief Extract the numeric user id of the token owner
 * Reads the "nameid" claim, falling back to "sub". Claims may be numbers or numeric strings.
 */
std::optional<int64_t> userIdFromToken(const std::string &token);

} // namespace JwtUtils
