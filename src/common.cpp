#include "common.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace {

bool parseHexDigits(const std::string& s, uint32_t& out) {
    if (s.size() != 6) return false;
    uint32_t v = 0;
    for (char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        v <<= 4;
        if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    out = v;
    return true;
}

bool parseChannel(const std::string& s, uint8_t& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str()) return false;
    while (*end != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*end))) return false;
        ++end;
    }
    if (v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

} // namespace

bool parseColor(const std::string& text, Color& out) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);
    }
    if (s.empty()) return false;

    if (s.find(',') != std::string::npos) {
        uint8_t ch[3] = { 0, 0, 0 };
        size_t start = 0;
        for (int i = 0; i < 3; ++i) {
            const size_t comma = s.find(',', start);
            const bool last = (i == 2);
            if (!last && comma == std::string::npos) return false;
            if (last && comma != std::string::npos) return false;
            const std::string part = s.substr(start, last ? std::string::npos : comma - start);
            if (!parseChannel(part, ch[i])) return false;
            start = comma + 1;
        }
        out = { ch[0], ch[1], ch[2], 255 };
        return true;
    }

    if (s[0] == '#') s.erase(0, 1);
    else if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.erase(0, 2);

    uint32_t v = 0;
    if (!parseHexDigits(s, v)) return false;
    out = rgb(v);
    return true;
}

std::string colorToHex(const Color& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02x%02x%02x", c.r, c.g, c.b);
    return std::string(buf);
}
