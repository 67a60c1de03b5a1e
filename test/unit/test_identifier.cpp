#include "cppjson/core/identifier.hpp"
#include "cppjson/core/utf8.hpp"

#include <gtest/gtest.h>

#include <string>

using cppjson::format_identifier;
using cppjson::is_uppercase_fixup;
using cppjson::soft_camel;
using cppjson::title_case;

TEST(Identifier, UppercaseFixupOnLastSegment) {
    EXPECT_EQ(format_identifier("quest_id"), "questID");
    EXPECT_EQ(format_identifier("quest_url"), "questURL");
    EXPECT_EQ(format_identifier("QUEST_Id"), "qUESTID");
    EXPECT_EQ(format_identifier("avatar_image_url"), "avatarImageURL");
}

TEST(Identifier, FixupOnlyAppliesToLastSegment) {
    EXPECT_EQ(format_identifier("id_card"), "idCard");
    EXPECT_EQ(format_identifier("url_path"), "urlPath");
    EXPECT_EQ(format_identifier("ids"), "ids");
}

TEST(Identifier, SingleFixupSegmentKeepsUpperTail) {
    EXPECT_EQ(format_identifier("id"), "iD");
    EXPECT_EQ(format_identifier("URL"), "uRL");
}

TEST(Identifier, LowersFirstRuneOnly) {
    EXPECT_EQ(format_identifier("FloorCount"), "floorCount");
    EXPECT_EQ(format_identifier("floorCount"), "floorCount");
    EXPECT_EQ(format_identifier("questId"), "questId");
    EXPECT_EQ(format_identifier("HTTPStatus"), "hTTPStatus");
}

TEST(Identifier, JoinsUnderscoreParts) {
    EXPECT_EQ(format_identifier("created_at"), "createdAt");
    EXPECT_EQ(format_identifier("a_b_c"), "aBC");
    EXPECT_EQ(format_identifier("snake__double"), "snakeDouble");
    EXPECT_EQ(format_identifier("_private"), "private");
    EXPECT_EQ(format_identifier("trailing_"), "trailing");
}

TEST(Identifier, SanitizesInvalidRunes) {
    EXPECT_EQ(format_identifier("foo-bar"), "foo_Bar");
    EXPECT_EQ(format_identifier("user name"), "user_Name");
    EXPECT_EQ(format_identifier("$ref"), "_Ref");
    EXPECT_EQ(format_identifier("@type"), "_Type");
    EXPECT_EQ(format_identifier("a.b.c"), "a_B_C");
}

TEST(Identifier, LeadingDigitBecomesUnderscore) {
    EXPECT_EQ(format_identifier("1st_place"), "_stPlace");
    EXPECT_EQ(format_identifier("404"), "_04");
    EXPECT_EQ(format_identifier("x2"), "x2");
}

TEST(Identifier, DegenerateKeys) {
    EXPECT_EQ(format_identifier(""), "");
    EXPECT_EQ(format_identifier("_"), "");
    EXPECT_EQ(format_identifier("---"), "___");
    EXPECT_EQ(format_identifier("!"), "_");
}

TEST(Identifier, InvalidUtf8BecomesUnderscore) {
    std::string key = "a\xFF"
                      "b";
    EXPECT_EQ(format_identifier(key), "a_b");
}

TEST(Identifier, NonAsciiLetters) {
    // "émoji_id": é is title-cased, then lowered again by the camel pass.
    EXPECT_EQ(format_identifier("\xC3\xA9moji_id"), "\xC3\xA9mojiID");
    EXPECT_EQ(format_identifier("\xC3\x89t\xC3\xA9"), "\xC3\xA9t\xC3\xA9");
    // U+2764 HEAVY BLACK HEART is neither a letter nor a digit.
    EXPECT_EQ(format_identifier("love\xE2\x9D\xA4"), "love_");
    // Other-letter runes are kept as they are.
    EXPECT_EQ(format_identifier("\xE5\x90\x8D\xE5\x89\x8D"), "\xE5\x90\x8D\xE5\x89\x8D");
}

TEST(Identifier, OnlyLetterCategoriesCountAsLetters) {
    // U+093F DEVANAGARI VOWEL SIGN I is a spacing mark, not a letter.
    EXPECT_EQ(format_identifier("\xE0\xA4\x95\xE0\xA4\xBF"), "\xE0\xA4\x95_");
    // U+2160 ROMAN NUMERAL ONE is a letter number, neither letter nor decimal digit.
    EXPECT_EQ(format_identifier("x\xE2\x85\xA0"), "x_");
}

TEST(Identifier, NonAsciiDecimalDigits) {
    // U+0663 ARABIC-INDIC DIGIT THREE
    EXPECT_EQ(format_identifier("x\xD9\xA3"), "x\xD9\xA3");
    EXPECT_EQ(format_identifier("\xD9\xA3x"), "_x");
}

TEST(Identifier, TitleCaseFollowsSeparators) {
    EXPECT_EQ(title_case("hello world"), "Hello World");
    EXPECT_EQ(title_case("foo-bar.baz"), "Foo-Bar.Baz");
    EXPECT_EQ(title_case("1st"), "1st");
    EXPECT_EQ(title_case("snake_case"), "Snake_case");
    EXPECT_EQ(title_case(""), "");
}

TEST(Identifier, SoftCamelLowersAfterSeparators) {
    EXPECT_EQ(soft_camel("Hello World"), "hello world");
    EXPECT_EQ(soft_camel("Foo_Bar"), "foo_Bar");
    EXPECT_EQ(soft_camel("ABC"), "aBC");
}

TEST(Identifier, FixupTable) {
    EXPECT_TRUE(is_uppercase_fixup("id"));
    EXPECT_TRUE(is_uppercase_fixup("url"));
    EXPECT_FALSE(is_uppercase_fixup("ID"));
    EXPECT_FALSE(is_uppercase_fixup("uri"));
    EXPECT_FALSE(is_uppercase_fixup(""));
}

TEST(Identifier, IsDeterministic) {
    const std::string key = "Some_weird-Key_url";
    EXPECT_EQ(format_identifier(key), format_identifier(key));
    EXPECT_EQ(format_identifier(key), "someWeird_KeyURL");
}
