#include "cppjson/core/result.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace cppjson;

TEST(Result, HasValueSuccess) {
    result<int> r = 42;
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, HasValueError) {
    result<int> r = std::unexpected(make_error_code(error_code::invalid_json));
    EXPECT_FALSE(r.has_value());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_EQ(r.error(), make_error_code(error_code::invalid_json));
}

TEST(Result, ErrorCodeEnumConvertsImplicitly) {
    std::error_code ec = error_code::unsupported_shape;
    EXPECT_EQ(ec, make_error_code(error_code::unsupported_shape));
    EXPECT_EQ(ec.value(), static_cast<int>(error_code::unsupported_shape));
    EXPECT_NE(ec, make_error_code(error_code::invalid_json));
}

TEST(Result, CategoryNameAndMessages) {
    const auto& cat = get_error_category();
    EXPECT_STREQ(cat.name(), "cppjson");
    EXPECT_EQ(make_error_code(error_code::ok).message(), "success");
    EXPECT_EQ(make_error_code(error_code::invalid_json).message(), "invalid JSON document");
    EXPECT_EQ(make_error_code(error_code::unsupported_shape).message(),
              "top-level value must be an object or a non-empty array of objects");
    EXPECT_EQ(cat.message(99), "unknown error");
}

TEST(Result, CategoryIsSingleton) {
    EXPECT_EQ(&get_error_category(), &get_error_category());
    EXPECT_EQ(&make_error_code(error_code::invalid_json).category(), &get_error_category());
}

namespace {

result<size_t> doubled_length(const result<std::string>& in) {
    if (!in) {
        return std::unexpected(in.error());
    }
    return in->size() * 2;
}

} // namespace

TEST(Result, PropagatesValue) {
    auto out = doubled_length(std::string("{}"));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), 4u);
}

TEST(Result, PropagatesError) {
    auto out = doubled_length(std::unexpected(make_error_code(error_code::unsupported_shape)));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), make_error_code(error_code::unsupported_shape));
}

TEST(Result, ValueOrFallback) {
    result<int> r = std::unexpected(make_error_code(error_code::invalid_json));
    EXPECT_EQ(r.value_or(7), 7);
}

TEST(Result, MoveOnlyValue) {
    result<std::string> r = std::string("struct Foo {\n};\n");
    auto moved = std::move(r).value();
    EXPECT_EQ(moved, "struct Foo {\n};\n");
}
