#include "utils/Time.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool readDigits(const std::string &s, size_t &pos, size_t count, int &out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string &s, size_t &pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

std::optional<std::chrono::system_clock::time_point> parseISO8601(const std::string &iso) {
    if (iso.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!readDigits(iso, pos, 4, year) || !expect(iso, pos, '-') || !readDigits(iso, pos, 2, month) ||
        !expect(iso, pos, '-') || !readDigits(iso, pos, 2, day)) {
        return std::nullopt;
    }

    if (pos >= iso.size() || (iso[pos] != 'T' && iso[pos] != 't' && iso[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;

    if (!readDigits(iso, pos, 2, hour) || !expect(iso, pos, ':') || !readDigits(iso, pos, 2, minute)) {
        return std::nullopt;
    }
    if (pos < iso.size() && iso[pos] == ':') {
        ++pos;
        if (!readDigits(iso, pos, 2, second)) {
            return std::nullopt;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (pos < iso.size() && (iso[pos] == '.' || iso[pos] == ',')) {
        ++pos;
        std::string fractionalStr;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) {
            fractionalStr += iso[pos++];
        }
        if (fractionalStr.empty()) {
            return std::nullopt;
        }
        if (fractionalStr.length() < 6) {
            fractionalStr.append(6 - fractionalStr.length(), '0');
        } else if (fractionalStr.length() > 6) {
            fractionalStr = fractionalStr.substr(0, 6);
        }
        micros = std::stoll(fractionalStr);
    }

    int offsetMinutes = 0;
    if (pos < iso.size()) {
        char zone = iso[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int offH = 0, offM = 0;
            if (!readDigits(iso, pos, 2, offH)) {
                return std::nullopt;
            }
            if (pos < iso.size() && iso[pos] == ':') {
                ++pos;
            }
            if (!readDigits(iso, pos, 2, offM) || offH > 23 || offM > 59) {
                return std::nullopt;
            }
            offsetMinutes = (offH * 60 + offM) * (zone == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }

    if (pos != iso.size()) {
        return std::nullopt;
    }

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;

    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
}

std::string formatISO8601(const std::chrono::system_clock::time_point &tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};

#ifdef _WIN32
    gmtime_s(&tm, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

    auto since_epoch = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds);
    if (millis.count() < 0) {
        millis += std::chrono::seconds(1);
    }

    ss << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return ss.str();
}

std::chrono::milliseconds distance(const std::chrono::system_clock::time_point &a,
                                   const std::chrono::system_clock::time_point &b) {
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(a - b);
    return diff.count() < 0 ? -diff : diff;
}

} // namespace TimeUtils
