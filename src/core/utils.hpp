#pragma once

#include <string>
#include <ctime>
#include <optional>
#include <vector>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Strict integer parse: the whole string (surrounding whitespace allowed)
// must be a base-10 integer that fits in an int.
std::optional<int> parse_int(const std::string& s);

// Split a command line on whitespace. Double quotes group words
// ("my file.txt"); the quotes themselves are dropped.
std::vector<std::string> split_args(const std::string& line);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
