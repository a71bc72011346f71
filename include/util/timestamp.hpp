#pragma once

#include <chrono>
#include <cctype>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mv::util {

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

// Microsecond resolution, matching what PostgreSQL stores
inline Timestamp systemNow() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

inline std::tm toUtcTm(const Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(ts));
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

inline std::string formatUtc(const Timestamp ts, const char* fmt) {
    const std::tm tm = toUtcTm(ts);
    char buffer[64];
    const auto n = std::strftime(buffer, sizeof(buffer), fmt, &tm);
    return {buffer, n};
}

// "2024-05-01T12:00:00.123456Z"
inline std::string timestampToString(const Timestamp ts) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(ts);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts - secs).count();
    std::ostringstream oss;
    oss << formatUtc(ts, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

// Accepts "YYYY-MM-DD HH:MM:SS[.ffffff][+zz]" and the ISO "T" form; the zone suffix is ignored (sessions run in UTC)
inline Timestamp parsePostgresTimestamp(const std::string& timestampStr) {
    if (timestampStr.size() < 19) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);

    std::string head = timestampStr.substr(0, 19);
    if (head[10] == 'T') head[10] = ' ';

    std::tm tm = {};
    std::istringstream ss(head);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);

    auto ts = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (timestampStr.size() > 19 && timestampStr[19] == '.') {
        std::string frac;
        for (size_t i = 20; i < timestampStr.size() && std::isdigit(static_cast<unsigned char>(timestampStr[i])); ++i)
            frac.push_back(timestampStr[i]);
        frac.resize(6, '0');
        ts += std::chrono::microseconds(std::stol(frac));
    }

    return std::chrono::time_point_cast<std::chrono::microseconds>(ts);
}

// SigV4 x-amz-date
inline std::string amzDate(const Timestamp ts) { return formatUtc(ts, "%Y%m%dT%H%M%SZ"); }

// SigV4 credential scope date
inline std::string getDate(const Timestamp ts) { return formatUtc(ts, "%Y%m%d"); }

inline std::string compactTimestamp(const Timestamp ts) { return formatUtc(ts, "%Y%m%d%H%M%S"); }

} // namespace mv::util
