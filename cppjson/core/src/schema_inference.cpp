#include "cppjson/core/identifier.hpp"
#include "cppjson/core/schema.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cppjson::schema {

namespace {

using json::json_value;

// Runtime kind used to decide whether an array is homogeneous. Integer and
// floating point literals share one group.
enum class element_group : uint8_t { null, boolean, number, string, array, object };

element_group group_of(const json_value& v) noexcept {
    switch (v.k) {
    case json_value::kind::null:
        return element_group::null;
    case json_value::kind::boolean:
        return element_group::boolean;
    case json_value::kind::integer:
    case json_value::kind::number:
        return element_group::number;
    case json_value::kind::string:
        return element_group::string;
    case json_value::kind::array:
        return element_group::array;
    case json_value::kind::object:
        return element_group::object;
    }
    return element_group::null;
}

scalar_kind number_kind(const json_value& v, const infer_options& opts) noexcept {
    if (v.k == json_value::kind::integer && opts.integer_inference) {
        return scalar_kind::integer64;
    }
    return scalar_kind::floating;
}

type_descriptor
infer_array(std::string_view key, const json_value& value, const infer_options& opts) {
    const auto& items = value.array;
    if (items.empty()) {
        return type_descriptor::make_array(type_descriptor::unknown());
    }

    const element_group group = group_of(items.front());
    for (const auto& item : items) {
        if (group_of(item) != group) {
            return type_descriptor::make_array(type_descriptor::unknown());
        }
    }

    if (group == element_group::number) {
        scalar_kind k = number_kind(items.front(), opts);
        for (const auto& item : items) {
            if (number_kind(item, opts) == scalar_kind::floating) {
                k = scalar_kind::floating;
                break;
            }
        }
        return type_descriptor::make_array(type_descriptor::make_scalar(k));
    }

    // Representative shape: only the first element is inspected.
    return type_descriptor::make_array(infer_value(key, items.front(), opts));
}

} // namespace

const field_descriptor* type_descriptor::find_field(std::string_view source_key) const noexcept {
    for (const auto& f : fields) {
        if (f.source_key == source_key) {
            return &f;
        }
    }
    return nullptr;
}

type_descriptor
infer_value(std::string_view key, const json_value& value, const infer_options& opts) {
    switch (value.k) {
    case json_value::kind::null:
        return type_descriptor::unknown();
    case json_value::kind::boolean:
        return type_descriptor::make_scalar(scalar_kind::boolean);
    case json_value::kind::integer:
    case json_value::kind::number:
        return type_descriptor::make_scalar(number_kind(value, opts));
    case json_value::kind::string:
        return type_descriptor::make_scalar(scalar_kind::string);
    case json_value::kind::array:
        return infer_array(key, value, opts);
    case json_value::kind::object:
        return infer_struct(std::string(key), value, opts);
    }
    return type_descriptor::unknown();
}

type_descriptor
infer_struct(std::string struct_name, const json_value& object, const infer_options& opts) {
    auto result = type_descriptor::make_struct(std::move(struct_name));

    std::vector<const json_value::object_type::value_type*> members;
    members.reserve(object.object.size());
    for (const auto& kv : object.object) {
        members.push_back(&kv);
    }
    std::sort(members.begin(), members.end(), [](const auto* a, const auto* b) {
        return a->first < b->first;
    });

    result.fields.reserve(members.size());
    for (const auto* kv : members) {
        field_descriptor field;
        field.source_key = kv->first;
        field.identifier = format_identifier(kv->first);
        field.type = infer_value(kv->first, kv->second, opts);
        result.fields.push_back(std::move(field));
    }
    return result;
}

schema_stats collect_stats(const type_descriptor& type) noexcept {
    schema_stats stats;
    switch (type.kind) {
    case type_kind::nested_struct:
        ++stats.structs;
        for (const auto& f : type.fields) {
            ++stats.fields;
            auto nested = collect_stats(f.type);
            stats.structs += nested.structs;
            stats.fields += nested.fields;
        }
        break;
    case type_kind::array_of:
        if (type.element) {
            stats = collect_stats(*type.element);
        }
        break;
    case type_kind::scalar:
    case type_kind::unknown:
        break;
    }
    return stats;
}

} // namespace cppjson::schema
