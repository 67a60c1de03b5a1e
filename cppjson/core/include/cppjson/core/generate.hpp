#pragma once

#include "json_value.hpp"
#include "renderer.hpp"
#include "result.hpp"
#include "schema.hpp"

#include <istream>
#include <string>
#include <string_view>

namespace cppjson {

inline constexpr std::string_view kDefaultStructName = "Foo";

struct generate_options {
    std::string struct_name{kDefaultStructName};
    schema::infer_options infer{};
    render_options render{};
};

struct generation {
    std::string text;
    schema::schema_stats stats;
};

// Picks the object whose shape becomes the root struct: the document itself,
// or the first element of a non-empty array of objects.
result<const json::json_value*> select_root(const json::json_value& document,
                                            std::string* detail = nullptr);

// Decode, shape check, inference and rendering in one step. On failure
// nothing is produced and `detail` receives a one-line description.
result<generation> generate(std::string_view input,
                            const generate_options& opts = {},
                            std::string* detail = nullptr);

// Reads `input` to the end before decoding.
result<generation> generate(std::istream& input,
                            const generate_options& opts = {},
                            std::string* detail = nullptr);

} // namespace cppjson
