#pragma once

#include <string>
#include <cstdint>
#include "types.hpp"

// Format a time point as ISO 8601 UTC (YYYY-MM-DDTHH:MM:SSZ).
std::string to_iso_utc(TimePoint tp);

// Parse an ISO 8601 UTC timestamp. Returns false on failure.
bool parse_iso_utc(const std::string& iso, TimePoint& out);

// Format a time point as local "YYYY-MM-DD HH:MM:SS" for display.
std::string format_local(TimePoint tp);

// Lowercase ASCII copy.
std::string to_lower(std::string s);

// 64-bit hash as 16 lowercase hex digits, and back. parse returns false on bad input.
std::string hash_to_hex(uint64_t hash);
bool hex_to_hash(const std::string& hex, uint64_t& out);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
