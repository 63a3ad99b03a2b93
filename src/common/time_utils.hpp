#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace regdelta {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Accepts only real calendar dates in YYYY-MM-DD form (2024-02-30 is rejected).
inline bool isValidCaptureDate(const std::string &value)
{
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return false;
    }
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%d");
    if (in.fail()) {
        return false;
    }
    const int year = tm.tm_year;
    const int month = tm.tm_mon;
    const int day = tm.tm_mday;
    const std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return false;
    }
    std::tm check{};
    gmtime_r(&time, &check);
    return check.tm_year == year && check.tm_mon == month && check.tm_mday == day;
}

// "2024-01-05" -> "20240105", the partition name used for change logs.
inline std::string compactDate(const std::string &captureDate)
{
    std::string out;
    out.reserve(8);
    for (char c : captureDate) {
        if (c != '-') {
            out.push_back(c);
        }
    }
    return out;
}

// "20240105" -> "2024-01-05"; anything else is returned unchanged.
inline std::string expandCompactDate(const std::string &value)
{
    if (value.size() != 8) {
        return value;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return value;
        }
    }
    return value.substr(0, 4) + "-" + value.substr(4, 2) + "-" + value.substr(6, 2);
}

} // namespace regdelta
