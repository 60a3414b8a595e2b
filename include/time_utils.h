#pragma once
#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * Cross platform safe localtime wrapper.
 * windows -> localtime_s
 * Linux/Unix -> localtime_r
 */
inline std::tm safe_localtime(std::time_t time){
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

/**
 * Wall clock timestamp used as log line prefix, e.g. "2024-05-01 12:00:00".
 */
inline std::string format_local_time(std::chrono::system_clock::time_point tp){
    std::tm tm_buf = safe_localtime(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%F %T");
    return ss.str();
}

/**
 * Millisecond count of a steady clock duration, for logs and metrics.
 */
template <typename Rep, typename Period>
inline long long to_millis(std::chrono::duration<Rep, Period> d){
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

#endif // TIME_UTILS_H
