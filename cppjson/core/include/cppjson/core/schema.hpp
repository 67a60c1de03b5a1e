#pragma once

#include "json_value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cppjson::schema {

enum class scalar_kind : uint8_t { string, floating, integer64, boolean };

enum class type_kind : uint8_t { scalar, nested_struct, array_of, unknown };

struct field_descriptor;

struct type_descriptor {
    type_kind kind{type_kind::unknown};
    scalar_kind scalar{scalar_kind::string};     // kind == scalar
    std::string struct_name;                     // kind == nested_struct
    std::vector<field_descriptor> fields;        // kind == nested_struct, sorted by source_key
    std::unique_ptr<type_descriptor> element;    // kind == array_of

    static type_descriptor unknown();
    static type_descriptor make_scalar(scalar_kind k);
    static type_descriptor make_struct(std::string name);
    static type_descriptor make_array(type_descriptor element_type);

    bool is_struct() const noexcept { return kind == type_kind::nested_struct; }

    const field_descriptor* find_field(std::string_view source_key) const noexcept;
};

struct field_descriptor {
    std::string source_key;
    std::string identifier;
    type_descriptor type;
};

inline type_descriptor type_descriptor::unknown() {
    return type_descriptor{};
}

inline type_descriptor type_descriptor::make_scalar(scalar_kind k) {
    type_descriptor t;
    t.kind = type_kind::scalar;
    t.scalar = k;
    return t;
}

inline type_descriptor type_descriptor::make_struct(std::string name) {
    type_descriptor t;
    t.kind = type_kind::nested_struct;
    t.struct_name = std::move(name);
    return t;
}

inline type_descriptor type_descriptor::make_array(type_descriptor element_type) {
    type_descriptor t;
    t.kind = type_kind::array_of;
    t.element = std::make_unique<type_descriptor>(std::move(element_type));
    return t;
}

struct infer_options {
    // Integer literals infer as int64_t; when false every number is floating point.
    bool integer_inference = true;
};

// Infers the struct for one JSON object. Fields come out in byte order of their
// keys. Nested objects become nested structs named after their key; arrays of
// objects use the first element as the representative shape.
type_descriptor infer_struct(std::string struct_name,
                             const json::json_value& object,
                             const infer_options& opts = {});

// Type of a single value found under `key`. Total: ambiguous values infer as unknown.
type_descriptor
infer_value(std::string_view key, const json::json_value& value, const infer_options& opts = {});

struct schema_stats {
    size_t structs = 0;
    size_t fields = 0;
};

// Counts declarations and field lines the renderer will emit for `type`.
schema_stats collect_stats(const type_descriptor& type) noexcept;

} // namespace cppjson::schema
