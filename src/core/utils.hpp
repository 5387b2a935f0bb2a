#pragma once

#include <string>
#include <cstddef>
#include <vector>

// Generate a compact timestamp (YYYYMMDDTHHMMSS-mmm) for the current UTC time.
// Used as the sortable prefix of generated job ids.
std::string now_compact_stamp();

// Random lowercase hex string of the given length.
std::string random_hex(std::size_t len);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on a single delimiter, dropping empty pieces.
std::vector<std::string> split(const std::string& s, char delim);

// Lowercase copy.
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

