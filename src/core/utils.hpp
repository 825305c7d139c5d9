#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse a TCP port. Returns -1 unless s is a whole number in [min_port, 65535].
int parse_port(const std::string& s, int min_port = 1);

// Lower-case copy (ASCII).
std::string to_lower(std::string s);

// Replace every occurrence of `from` with `to`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Single-quote a string for POSIX sh.
std::string shell_quote(const std::string& s);

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
