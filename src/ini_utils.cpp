#include "ini_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

bool onlySpaceFrom(const char* p) {
    while (*p != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*p))) return false;
        ++p;
    }
    return true;
}

} // namespace

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

std::string stripIniComment(const std::string& line) {
    const size_t hash = line.find('#');
    const size_t semi = line.find(';');
    const size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                                semi == std::string::npos ? line.size() : semi);
    return line.substr(0, cut);
}

bool splitIniLine(const std::string& line, std::string& key, std::string& value) {
    const size_t eq = line.find('=');
    if (eq == std::string::npos) return false;
    key = toLower(trim(line.substr(0, eq)));
    value = trim(line.substr(eq + 1));
    return true;
}

std::vector<std::string> splitDot(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '.') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::string> splitList(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            out.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(trim(cur));
    return out;
}

bool parseInt(const std::string& raw, int& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 0);
    if (end == s.c_str() || errno == ERANGE || !onlySpaceFrom(end)) return false;
    if (v < -2147483647L - 1L || v > 2147483647L) return false;
    out = static_cast<int>(v);
    return true;
}

bool parseUint32(const std::string& raw, unsigned int& out) {
    const std::string s = trim(raw);
    if (s.empty() || s[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 0);
    if (end == s.c_str() || errno == ERANGE || !onlySpaceFrom(end)) return false;
    if (v > 0xFFFFFFFFull) return false;
    out = static_cast<unsigned int>(v);
    return true;
}

bool parseDouble(const std::string& raw, double& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || errno == ERANGE || !onlySpaceFrom(end)) return false;
    out = v;
    return true;
}

bool parseFloat(const std::string& raw, float& out) {
    double v = 0.0;
    if (!parseDouble(raw, v)) return false;
    out = static_cast<float>(v);
    return true;
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string s = toLower(trim(raw));
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

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}
