#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pt::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return timegm(&tm);
}

// ISO 8601 UTC with millisecond precision, e.g. 2026-10-18T12:00:00.123Z
inline std::string timePointToString(const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto secs = time_point_cast<seconds>(tp);
    const auto ms = duration_cast<milliseconds>(tp - secs).count();
    const std::time_t t = system_clock::to_time_t(secs);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&t), "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

inline std::chrono::system_clock::time_point parseTimePoint(const std::string& iso) {
    using namespace std::chrono;
    auto tp = system_clock::from_time_t(parseTimestampFromString(iso));
    if (const auto dot = iso.find('.'); dot != std::string::npos) {
        const auto end = iso.find_first_not_of("0123456789", dot + 1);
        auto frac = iso.substr(dot + 1, end == std::string::npos ? std::string::npos : end - dot - 1);
        frac.resize(3, '0');
        tp += milliseconds(std::stoi(frac));
    }
    return tp;
}

// SigV4 x-amz-date, e.g. 20261018T120000Z
inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    const std::tm tm = *gmtime(&now_c);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

// SigV4 credential scope date, e.g. 20261018
inline std::string getDate() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    const std::tm tm = *gmtime(&now_c);
    char buffer[9];
    strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return {buffer};
}

} // namespace pt::util
