#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

using Clock = std::chrono::system_clock;

// 2026-10-16T08:30:00.000Z
std::string formatIso8601(Clock::time_point tp);

// Accepts YYYY-MM-DDTHH:MM:SS with optional fraction and a `Z` or +HH:MM
// offset (a space may replace the `T`). Throws std::invalid_argument.
Clock::time_point parseIso8601(const std::string& text);

#endif // TIME_UTILS_HPP
