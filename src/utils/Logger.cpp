#include "utils/Logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace Logger {

namespace {

struct LevelStyle {
    const char *name;
    const char *color;
};

// Indexed by Level
constexpr std::array<LevelStyle, 5> kStyles = {{
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[37m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"NONE", "\033[0m"},
}};

constexpr const char *kDim = "\033[90m";
constexpr const char *kReset = "\033[0m";

std::mutex g_mutex;
Level g_level = Level::INFO;
Sink g_sink;

const LevelStyle &styleOf(Level level) {
    const auto index = static_cast<size_t>(level);
    return index < kStyles.size() ? kStyles[index] : kStyles[1];
}

std::string clockTime() {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string format(Level level, const std::string &prefix, const std::string &message, bool color) {
    const LevelStyle &style = styleOf(level);
    const char *dim = color ? kDim : "";
    const char *reset = color ? kReset : "";

    std::ostringstream out;
    out << dim << clockTime() << reset << ' ';
    if (!prefix.empty()) {
        out << dim << '[' << prefix << "] " << reset;
    }
    out << (color ? style.color : "") << '[' << style.name << "] " << message << reset;
    return out.str();
}

} // namespace

void setLevel(Level level) {
    std::scoped_lock lock(g_mutex);
    g_level = level;
}

std::optional<Level> parseLevel(const std::string &name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "WARNING")
        return Level::WARN;
    if (upper == "OFF")
        return Level::NONE;

    for (size_t i = 0; i < kStyles.size(); ++i) {
        if (upper == kStyles[i].name)
            return static_cast<Level>(i);
    }
    return std::nullopt;
}

void setSink(Sink sink) {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void debug(const std::string &message) { log(Level::DEBUG, "", message); }
void info(const std::string &message) { log(Level::INFO, "", message); }
void warn(const std::string &message) { log(Level::WARN, "", message); }
void error(const std::string &message) { log(Level::ERROR, "", message); }

void log(Level level, const std::string &prefix, const std::string &message) {
    if (level == Level::NONE)
        return;

    std::scoped_lock lock(g_mutex);
    if (g_level == Level::NONE || level < g_level)
        return;

    if (g_sink) {
        g_sink(level, format(level, prefix, message, false));
        return;
    }

    // WARN and ERROR go to stderr
    std::ostream &stream = level >= Level::WARN ? std::cerr : std::cout;
    stream << format(level, prefix, message, true) << '\n';
    stream.flush();
}

} // namespace Logger
