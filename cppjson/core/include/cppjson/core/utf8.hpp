#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cppjson::utf8 {

inline constexpr char32_t replacement_char = 0xFFFD;

// Decodes one scalar value at `pos`. Malformed, overlong or surrogate
// sequences yield U+FFFD and consume a single byte.
size_t decode(std::string_view s, size_t pos, char32_t& cp) noexcept;

void append(std::string& out, char32_t cp);

std::u32string to_runes(std::string_view s);
std::string from_runes(std::u32string_view runes);

// Classification and simple case mapping over the full Unicode range.
bool is_letter(char32_t cp) noexcept;
bool is_digit(char32_t cp) noexcept;
bool is_space(char32_t cp) noexcept;
char32_t to_lower(char32_t cp) noexcept;
char32_t to_upper(char32_t cp) noexcept;
char32_t to_title(char32_t cp) noexcept;

} // namespace cppjson::utf8
