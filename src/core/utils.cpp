#include "utils.hpp"
#include <algorithm>
#include <cctype>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

int parse_port(const std::string& s, int min_port) {
    if (s.empty() || s.size() > 5) return -1;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        return -1;
    int port = safe_stoi(s, -1);
    if (port < min_port || port > 65535) return -1;
    return port;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string shell_quote(const std::string& s) {
    // 'it'\''s' form: close quote, escaped quote, reopen
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}
