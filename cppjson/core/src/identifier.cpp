#include "cppjson/core/identifier.hpp"

#include "cppjson/core/utf8.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace cppjson {

namespace {

constexpr std::array<std::string_view, 2> kUppercaseFixups = {"id", "url"};

bool is_separator(char32_t r) noexcept {
    if (r <= 0x7F) {
        if ((r >= '0' && r <= '9') || (r >= 'a' && r <= 'z') || (r >= 'A' && r <= 'Z') ||
            r == '_') {
            return false;
        }
        return true;
    }
    if (utf8::is_letter(r) || utf8::is_digit(r)) {
        return false;
    }
    return utf8::is_space(r);
}

template <typename Fn> std::string map_after_separator(std::string_view s, Fn&& fn) {
    std::u32string runes = utf8::to_runes(s);
    char32_t prev = ' ';
    for (auto& r : runes) {
        char32_t current = r;
        if (is_separator(prev)) {
            r = fn(r);
        }
        prev = current;
    }
    return utf8::from_runes(runes);
}

std::string map_all(std::string_view s, char32_t (*fn)(char32_t) noexcept) {
    std::u32string runes = utf8::to_runes(s);
    for (auto& r : runes) {
        r = fn(r);
    }
    return utf8::from_runes(runes);
}

std::vector<std::string> split_parts(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = key.find('_', start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(key.substr(start));
            break;
        }
        parts.emplace_back(key.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

bool is_uppercase_fixup(std::string_view lowered_segment) noexcept {
    for (auto fixup : kUppercaseFixups) {
        if (fixup == lowered_segment) {
            return true;
        }
    }
    return false;
}

std::string title_case(std::string_view s) {
    return map_after_separator(s, [](char32_t r) { return utf8::to_title(r); });
}

std::string soft_camel(std::string_view s) {
    return map_after_separator(s, [](char32_t r) { return utf8::to_lower(r); });
}

std::string format_identifier(std::string_view key) {
    auto parts = split_parts(key);
    for (auto& part : parts) {
        part = title_case(part);
    }

    auto& last = parts.back();
    if (is_uppercase_fixup(map_all(last, utf8::to_lower))) {
        last = map_all(last, utf8::to_upper);
    }

    std::string assembled;
    assembled.reserve(key.size());
    for (const auto& part : parts) {
        assembled += part;
    }

    std::u32string runes = utf8::to_runes(assembled);
    for (size_t i = 0; i < runes.size(); ++i) {
        char32_t c = runes[i];
        bool ok = (i == 0) ? utf8::is_letter(c) : (utf8::is_letter(c) || utf8::is_digit(c));
        if (!ok) {
            runes[i] = U'_';
        }
    }

    return soft_camel(utf8::from_runes(runes));
}

} // namespace cppjson
