#pragma once

#include "json_value.hpp"
#include "schema.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace cppjson {

struct render_options {
    size_t indent_width = 4;
};

std::string_view scalar_type_name(schema::scalar_kind k) noexcept;

// Spelling of a field's type: "int64_t", "std::vector<piyo>", "std::any".
std::string type_name(const schema::type_descriptor& type);

// Writes the declaration of a nested_struct type. Child declarations are
// nested inside their parent, right before the field that uses them.
void render_struct(std::ostream& out,
                   const schema::type_descriptor& type,
                   const render_options& opts = {},
                   size_t depth = 0);

std::string render_struct(const schema::type_descriptor& type, const render_options& opts = {});

std::string infer_and_render(std::string struct_name,
                             const json::json_value& object,
                             const schema::infer_options& infer_opts = {},
                             const render_options& opts = {});

} // namespace cppjson
