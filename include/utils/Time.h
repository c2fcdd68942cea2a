#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace TimeUtils {

/**
 * @brief Parse an ISO 8601 timestamp string to a time_point
 * Accepts an optional fractional part and a "Z" or "+hh:mm"/"-hh:mm" suffix.
 * Timestamps without a zone designator are read as UTC.
 * @param iso ISO 8601 timestamp string (e.g., "2024-12-22T15:30:45.123+07:00")
 * @return time_point if parsing succeeds, std::nullopt otherwise
 */
std::optional<std::chrono::system_clock::time_point> parseISO8601(const std::string &iso);

/**
 * @brief Format a time_point to an ISO 8601 timestamp string in UTC
 * @param tp The time_point to format
 * @return ISO 8601 formatted string with millisecond precision and "Z" suffix
 */
std::string formatISO8601(const std::chrono::system_clock::time_point &tp);

/**
 * @brief Absolute distance between two time points
 */
std::chrono::milliseconds distance(const std::chrono::system_clock::time_point &a,
                                   const std::chrono::system_clock::time_point &b);

} // namespace TimeUtils
