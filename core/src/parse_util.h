#pragma once

// Private helpers shared by the report parsers.

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace patchbench::parse_util {

// Failure output kept per test case; longer text is cut.
constexpr size_t kMaxDetailsBytes = 16 * 1024;

inline std::string cap_details(std::string s) {
    if (s.size() > kMaxDetailsBytes) {
        s.resize(kMaxDetailsBytes);
        s += "\n...[truncated]";
    }
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) e--;
    return s.substr(b, e - b);
}

inline std::string strip_bom(const std::string& s) {
    if (s.size() >= 3 && (unsigned char)s[0] == 0xEF && (unsigned char)s[1] == 0xBB &&
        (unsigned char)s[2] == 0xBF) {
        return s.substr(3);
    }
    return s;
}

inline std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '\n') {
            if (!cur.empty() && cur.back() == '\r') cur.pop_back();
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) {
        if (cur.back() == '\r') cur.pop_back();
        out.push_back(cur);
    }
    return out;
}

// std::regex matching recurses once per input character; console lines are
// cut to this length before any pattern is applied.
constexpr size_t kMaxConsoleLineBytes = 4 * 1024;

inline std::vector<std::string> split_console_lines(const std::string& s) {
    std::vector<std::string> lines = split_lines(s);
    for (auto& line : lines) {
        if (line.size() > kMaxConsoleLineBytes) line.resize(kMaxConsoleLineBytes);
    }
    return lines;
}

// Remove ANSI colour escapes (ESC [ ... letter) emitted by most console runners.
inline std::string strip_ansi(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\x1b' && i + 1 < s.size() && s[i + 1] == '[') {
            i += 2;
            while (i < s.size() && !((s[i] >= 'A' && s[i] <= 'Z') || (s[i] >= 'a' && s[i] <= 'z'))) i++;
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}

inline int64_t to_i64(const std::string& s, int64_t defv = 0) {
    if (s.empty()) return defv;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str()) return defv;
    return (int64_t)v;
}

// Parses "0.25", "0.25s", "1,234.5" style durations into seconds.
inline double to_seconds(const std::string& s) {
    std::string digits;
    for (char c : s) {
        if (c != ',') digits.push_back(c);
    }
    char* end = nullptr;
    double v = std::strtod(digits.c_str(), &end);
    if (end == digits.c_str()) return 0.0;
    return v;
}

} // namespace patchbench::parse_util
