#include "time_utils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

std::string formatIso8601(Clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

Clock::time_point parseIso8601(const std::string& text) {
    int year, month, day, hour, minute, second;
    char sep;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7 ||
        (sep != 'T' && sep != ' ')) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }

    size_t pos = static_cast<size_t>(consumed);
    long millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long scale = 100;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    long offset_seconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                throw std::invalid_argument("Invalid ISO-8601 offset: " + text);
            }
            offset_seconds = (oh * 3600L + om * 60L) * (zone == '+' ? 1 : -1);
            pos += 6;
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t utc = timegm(&tm);

    return Clock::from_time_t(utc - offset_seconds) + std::chrono::milliseconds(millis);
}
