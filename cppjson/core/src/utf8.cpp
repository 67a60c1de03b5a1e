#include "cppjson/core/utf8.hpp"

#include <unicode/uchar.h>

namespace cppjson::utf8 {

namespace {

constexpr bool is_cont(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

} // namespace

size_t decode(std::string_view s, size_t pos, char32_t& cp) noexcept {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data()) + pos;
    const size_t rem = s.size() - pos;
    const unsigned char c0 = p[0];

    if (c0 < 0x80) {
        cp = c0;
        return 1;
    }
    if ((c0 & 0xE0) == 0xC0) {
        if (rem >= 2 && is_cont(p[1])) {
            char32_t t = (static_cast<char32_t>(c0 & 0x1F) << 6) | (p[1] & 0x3F);
            if (t >= 0x80) {
                cp = t;
                return 2;
            }
        }
    } else if ((c0 & 0xF0) == 0xE0) {
        if (rem >= 3 && is_cont(p[1]) && is_cont(p[2])) {
            char32_t t = (static_cast<char32_t>(c0 & 0x0F) << 12) |
                         (static_cast<char32_t>(p[1] & 0x3F) << 6) | (p[2] & 0x3F);
            if (t >= 0x800 && (t < 0xD800 || t > 0xDFFF)) {
                cp = t;
                return 3;
            }
        }
    } else if ((c0 & 0xF8) == 0xF0) {
        if (rem >= 4 && is_cont(p[1]) && is_cont(p[2]) && is_cont(p[3])) {
            char32_t t = (static_cast<char32_t>(c0 & 0x07) << 18) |
                         (static_cast<char32_t>(p[1] & 0x3F) << 12) |
                         (static_cast<char32_t>(p[2] & 0x3F) << 6) | (p[3] & 0x3F);
            if (t >= 0x10000 && t <= 0x10FFFF) {
                cp = t;
                return 4;
            }
        }
    }
    cp = replacement_char;
    return 1;
}

void append(std::string& out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = replacement_char;
    }
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::u32string to_runes(std::string_view s) {
    std::u32string runes;
    runes.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        char32_t cp = 0;
        pos += decode(s, pos, cp);
        runes.push_back(cp);
    }
    return runes;
}

std::string from_runes(std::u32string_view runes) {
    std::string out;
    out.reserve(runes.size());
    for (char32_t cp : runes) {
        append(out, cp);
    }
    return out;
}

// Letter and digit follow the general categories L and Nd; space follows the
// White_Space property.
bool is_letter(char32_t cp) noexcept {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
    }
    return u_isalpha(static_cast<UChar32>(cp)) != 0;
}

bool is_digit(char32_t cp) noexcept {
    if (cp < 0x80) {
        return cp >= '0' && cp <= '9';
    }
    return u_isdigit(static_cast<UChar32>(cp)) != 0;
}

bool is_space(char32_t cp) noexcept {
    switch (cp) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case 0x85:
    case 0xA0:
        return true;
    default:
        break;
    }
    if (cp < 0x100) {
        return false;
    }
    return u_isUWhiteSpace(static_cast<UChar32>(cp)) != 0;
}

char32_t to_lower(char32_t cp) noexcept {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
    }
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(cp)));
}

char32_t to_upper(char32_t cp) noexcept {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') ? cp - ('a' - 'A') : cp;
    }
    return static_cast<char32_t>(u_toupper(static_cast<UChar32>(cp)));
}

char32_t to_title(char32_t cp) noexcept {
    if (cp < 0x80) {
        return to_upper(cp);
    }
    return static_cast<char32_t>(u_totitle(static_cast<UChar32>(cp)));
}

} // namespace cppjson::utf8
