#pragma once

#include <string>
#include <string_view>

namespace cppjson {

// Trailing key segments rendered fully upper-case ("user_id" -> "userID").
bool is_uppercase_fixup(std::string_view lowered_segment) noexcept;

// Title-cases every rune that follows a separator, the first rune included.
std::string title_case(std::string_view s);

// Lower-cases every rune that follows a separator, the first rune included.
std::string soft_camel(std::string_view s);

// Turns a raw JSON key into a field identifier:
//   "quest_id" -> "questID", "FloorCount" -> "floorCount", "foo-bar" -> "foo_Bar".
// Never fails; runes that cannot appear in an identifier become underscores.
std::string format_identifier(std::string_view key);

} // namespace cppjson
