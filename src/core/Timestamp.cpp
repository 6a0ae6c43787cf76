/**
 * @file Timestamp.cpp
 * @brief ISO-8601 timestamp helpers
 */

#include "smsbridge/Timestamp.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace SmsBridge {

namespace {

bool readDigits(const std::string& s, size_t& pos, size_t count, int& value) {
    if (pos + count > s.size()) {
        return false;
    }
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    pos += count;
    value = v;
    return true;
}

bool expectChar(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // anonymous namespace

std::string formatIso8601(SystemTime t) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string nowIso8601() {
    return formatIso8601(std::chrono::system_clock::now());
}

bool parseIso8601(const std::string& text, SystemTime& out) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!readDigits(text, pos, 4, year) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return false;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return false;
    }
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expectChar(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expectChar(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return false;
        }
        for (size_t d = digits; d < 3; ++d) {
            millis *= 10;
        }
    }

    int offsetMinutes = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(text, pos, 2, oh)) {
                return false;
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!readDigits(text, pos, 2, om) || oh > 23 || om > 59) {
                return false;
            }
            offsetMinutes = (zone == '+' ? 1 : -1) * (oh * 60 + om);
        } else {
            return false;
        }
    }
    if (pos != text.size()) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return false;
    }

    const int64_t ms = static_cast<int64_t>(secs) * 1000 + millis
                       - static_cast<int64_t>(offsetMinutes) * 60 * 1000;
    out = fromEpochMs(ms);
    return true;
}

int64_t toEpochMs(SystemTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
}

SystemTime fromEpochMs(int64_t ms) {
    return SystemTime(std::chrono::duration_cast<SystemTime::duration>(
        std::chrono::milliseconds(ms)));
}

}  // namespace SmsBridge
