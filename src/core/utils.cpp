#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>

std::string to_iso_utc(TimePoint tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

bool parse_iso_utc(const std::string& iso, TimePoint& out) {
    if (iso.size() != 20 || iso.back() != 'Z') {
        return false;
    }

    struct tm tm_buf = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }

    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(t);
    return true;
}

std::string format_local(TimePoint tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string hash_to_hex(uint64_t hash) {
    return fmt::format("{:016x}", hash);
}

bool hex_to_hash(const std::string& hex, uint64_t& out) {
    if (hex.empty() || hex.size() > 16) return false;
    uint64_t value = 0;
    for (char c : hex) {
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return false;
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    out = value;
    return true;
}
