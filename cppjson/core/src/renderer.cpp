#include "cppjson/core/renderer.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace cppjson {

using schema::scalar_kind;
using schema::type_descriptor;
using schema::type_kind;

namespace {

// Struct declared by a field, looking through any number of array levels.
const type_descriptor* declared_struct(const type_descriptor& type) noexcept {
    const type_descriptor* t = &type;
    while (t->kind == type_kind::array_of && t->element) {
        t = t->element.get();
    }
    return t->is_struct() ? t : nullptr;
}

} // namespace

std::string_view scalar_type_name(scalar_kind k) noexcept {
    switch (k) {
    case scalar_kind::string:
        return "std::string";
    case scalar_kind::floating:
        return "float";
    case scalar_kind::integer64:
        return "int64_t";
    case scalar_kind::boolean:
        return "bool";
    }
    return "std::any";
}

std::string type_name(const type_descriptor& type) {
    switch (type.kind) {
    case type_kind::scalar:
        return std::string(scalar_type_name(type.scalar));
    case type_kind::nested_struct:
        return type.struct_name;
    case type_kind::array_of:
        if (type.element) {
            return "std::vector<" + type_name(*type.element) + ">";
        }
        return "std::vector<std::any>";
    case type_kind::unknown:
        break;
    }
    return "std::any";
}

void render_struct(std::ostream& out,
                   const type_descriptor& type,
                   const render_options& opts,
                   size_t depth) {
    std::string ind(depth * opts.indent_width, ' ');
    std::string field_ind((depth + 1) * opts.indent_width, ' ');

    out << ind << "struct " << type.struct_name << " {\n";
    for (const auto& field : type.fields) {
        if (const auto* nested = declared_struct(field.type)) {
            render_struct(out, *nested, opts, depth + 1);
        }
        out << field_ind << type_name(field.type) << " " << field.identifier << ";\n";
    }
    out << ind << "};\n";
}

std::string render_struct(const type_descriptor& type, const render_options& opts) {
    std::ostringstream out;
    render_struct(out, type, opts);
    return out.str();
}

std::string infer_and_render(std::string struct_name,
                             const json::json_value& object,
                             const schema::infer_options& infer_opts,
                             const render_options& opts) {
    auto root = schema::infer_struct(std::move(struct_name), object, infer_opts);
    return render_struct(root, opts);
}

} // namespace cppjson
