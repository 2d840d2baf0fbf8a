#pragma once
#include <string>
#include <string_view>
#include <cstdint>
#include <cstdio>
#include <cctype>

namespace linescrub {
namespace string_utils {

// Strip leading and trailing whitespace
inline std::string strip(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

// Check if string starts with prefix
inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Check if string ends with suffix
inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Make non-printable characters visible
inline std::string make_printable(std::string_view content) {
    std::string result;
    for (unsigned char ch : content) {
        if (std::isprint(ch) || ch == ' ' || ch >= 0x80) {
            result += static_cast<char>(ch);
        } else {
            // Format as <0xHH>
            char buf[8];
            std::snprintf(buf, sizeof(buf), "<0x%02x>", ch);
            result += buf;
        }
    }
    return result;
}

// Byte offset of the first invalid UTF-8 sequence, or npos when the whole
// buffer is well formed. Overlong forms, surrogates and code points above
// U+10FFFF are rejected.
inline std::size_t find_invalid_utf8(std::string_view s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = p[i];
        if (c < 0x80) {
            i++;
            continue;
        }
        std::size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return i;

        if (i + len > n) return i;
        for (std::size_t k = 1; k < len; k++) {
            if ((p[i + k] & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return i;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return i;
        i += len;
    }
    return std::string_view::npos;
}

inline bool is_valid_utf8(std::string_view s) {
    return find_invalid_utf8(s) == std::string_view::npos;
}

} // namespace string_utils
} // namespace linescrub
