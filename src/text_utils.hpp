#pragma once

// Small string helpers shared by the INI-ish config readers
// (settings.cpp, content.cpp, keybinds.cpp) and the command line.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

inline std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

inline std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

inline std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

// Strip comments (# or ;). Quoted strings are not handled.
inline std::string stripIniComment(const std::string& line) {
    const size_t hash = line.find('#');
    const size_t semi = line.find(';');
    const size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                                semi == std::string::npos ? line.size() : semi);
    return line.substr(0, cut);
}

inline bool parseInt(const std::string& raw, int& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    try {
        size_t idx = 0;
        const int v = std::stoi(s, &idx, 0);
        if (idx != s.size()) return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range
        return false;
    }
}

// Decimal or 0x-prefixed run seed. Rejects signs, trailing junk and values above UINT32_MAX.
inline bool parseSeed(const std::string& raw, uint32_t& out) {
    const std::string s = trim(raw);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    try {
        size_t idx = 0;
        const unsigned long long v = std::stoull(s, &idx, 0);
        if (idx != s.size() || v > UINT32_MAX) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

inline std::vector<std::string> splitOn(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == delim) {
            out.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(trim(cur));
    return out;
}

inline void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}
