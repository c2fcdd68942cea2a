#pragma once

#include <functional>
#include <optional>
#include <string>

#ifdef ERROR
#undef ERROR
#endif

namespace Logger {
enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, NONE = 4 };

/**
 * @brief Receives each formatted line that passes the level filter
 * The line carries no colour codes and no trailing newline. Runs under the logger's
 * lock, so a sink must not log.
 */
using Sink = std::function<void(Level level, const std::string &line)>;

void setLevel(Level level);

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...)
 * @return Level if the name is known, std::nullopt otherwise
 */
std::optional<Level> parseLevel(const std::string &name);

/**
 * @brief Redirect output; pass nullptr to go back to stdout/stderr
 */
void setSink(Sink sink);

void debug(const std::string &message);
void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

void log(Level level, const std::string &prefix, const std::string &message);
} // namespace Logger
