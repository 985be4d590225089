#pragma once
#include <string>
#include <cctype>

namespace morgue::engine {

    inline bool is_blank(const std::string& s) {
        for (unsigned char c : s) {
            if (!std::isspace(c)) return false;
        }
        return true;
    }

    inline std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace((unsigned char)s[b])) ++b;
        while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    // Cuts to at most max_bytes without splitting a UTF-8 sequence
    inline std::string truncate_utf8(const std::string& s, size_t max_bytes) {
        if (s.size() <= max_bytes) return s;
        size_t end = max_bytes;
        while (end > 0 && ((unsigned char)s[end] & 0xC0) == 0x80) --end;
        return s.substr(0, end);
    }

}
