#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace vc::util {

inline std::time_t parsePostgresTimestamp(const std::string& timestampStr) {
    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19)); // truncate to "YYYY-MM-DD HH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);
    return timegm(&tm); // returns UTC-based time_t
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[Z]" and "YYYY-MM-DD HH:MM:SS", returns 0 when unparsable.
inline std::time_t parseTimestampFromString(const std::string& iso) {
    if (iso.size() < 19) return 0;
    std::string normalized = iso.substr(0, 19);
    if (normalized[10] == 'T') normalized[10] = ' ';
    std::tm tm = {};
    std::istringstream ss(normalized);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) return 0;
    return timegm(&tm);
}

inline std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace vc::util
