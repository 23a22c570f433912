#include "text_utils.h"
#include <cctype>

size_t utf8_decode(const std::string& s, size_t pos, uint32_t& code_point) {
    if (pos >= s.size()) return 0;
    const unsigned char lead = static_cast<unsigned char>(s[pos]);

    size_t len;
    uint32_t cp;
    uint32_t min_cp;
    if (lead < 0x80) {
        code_point = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2; cp = lead & 0x1F; min_cp = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3; cp = lead & 0x0F; min_cp = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4; cp = lead & 0x07; min_cp = 0x10000;
    } else {
        return 0;
    }

    if (pos + len > s.size()) return 0;
    for (size_t i = 1; i < len; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    code_point = cp;
    return len;
}

std::string utf8_sanitize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(s, pos, cp);
        if (n == 0) {
            out += kUtf8Replacement;
            ++pos;
        } else {
            out.append(s, pos, n);
            pos += n;
        }
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < s.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(s, pos, cp);
        pos += (n == 0) ? 1 : n;
        ++count;
    }
    return count;
}

void utf8_pop_back(std::string& s) {
    if (s.empty()) return;
    size_t start = s.size() - 1;
    // Step back over at most three continuation bytes
    while (start > 0 && s.size() - start < 4 &&
           (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
        --start;
    }
    uint32_t cp = 0;
    if (utf8_decode(s, start, cp) == s.size() - start) {
        s.erase(start);
    } else {
        // Stray byte: drop just that byte
        s.pop_back();
    }
}

std::string utf8_tail(const std::string& s, size_t count) {
    if (count == 0) return std::string();
    size_t total = utf8_length(s);
    if (total <= count) return s;

    size_t skip = total - count;
    size_t pos = 0;
    while (pos < s.size() && skip > 0) {
        uint32_t cp = 0;
        size_t n = utf8_decode(s, pos, cp);
        pos += (n == 0) ? 1 : n;
        --skip;
    }
    return s.substr(pos);
}

std::string utf8_truncate_bytes(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t pos = 0;
    while (pos < s.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(s, pos, cp);
        if (n == 0) n = 1;
        if (pos + n > max_bytes) break;
        pos += n;
    }
    return s.substr(0, pos);
}

size_t display_width(const std::string& s) {
    size_t width = 0;
    size_t pos = 0;
    while (pos < s.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(s, pos, cp);
        if (n == 0) {
            width += 1;
            pos += 1;
            continue;
        }
        width += (cp > 127) ? 2 : 1;
        pos += n;
    }
    return width;
}

// ASCII whitespace plus the Unicode White_Space code points
bool is_space_code_point(uint32_t cp) {
    if (cp < 0x80) {
        return std::isspace(static_cast<int>(cp)) != 0;
    }
    switch (cp) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::string trim_copy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e) {
        uint32_t cp = 0;
        size_t n = utf8_decode(s, b, cp);
        if (n == 0 || !is_space_code_point(cp)) break;
        b += n;
    }
    while (e > b) {
        size_t start = e - 1;
        while (start > b && e - start < 4 &&
               (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
            --start;
        }
        uint32_t cp = 0;
        if (utf8_decode(s, start, cp) != e - start || !is_space_code_point(cp)) break;
        e = start;
    }
    return s.substr(b, e - b);
}
