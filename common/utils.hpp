#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace utils {

// Local wall-clock time formatted with strftime-style 'fmt'
inline std::string format_now(const char* fmt) {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, fmt);
    return ss.str();
}

// "2024-05-01 13:37:00", used for history records
inline std::string timestamp() {
    return format_now("%Y-%m-%d %H:%M:%S");
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    static const char* const units[] = {"KB", "MB", "GB"};
    double v = (double)bytes / 1024.0;
    int unit = 0;
    while (v >= 1024.0 && unit < 2) {
        v /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v << " " << units[unit];
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    if (bytes_per_sec < 1024.0) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
        return ss.str();
    }
    return format_bytes((u64)bytes_per_sec) + "/s";
}

// Integer percentage, floor(done / total * 100). A zero total is
// already complete.
inline int percent(u64 done, u64 total) {
    if (total == 0) return 100;
    if (done >= total) return 100;
    if (total <= UINT64_MAX / 100) return (int)(done * 100 / total);
    // done * 100 would overflow; total / 100 loses under 1e-16 relative
    u64 p = done / (total / 100);
    return (int)(p > 99 ? 99 : p);
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

} // namespace utils
