#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cppjson::json {

// Decoded JSON document node. Integer literals that fit in int64 keep their
// own kind so schema inference can tell `1` from `1.0`.
struct json_value {
    enum class kind : uint8_t { null, boolean, integer, number, string, array, object };

    using array_type = std::vector<json_value>;
    // Document order; keys are unique.
    using object_type = std::vector<std::pair<std::string, json_value>>;

    kind k{kind::null};
    bool boolean = false;
    int64_t integer = 0;
    double number = 0.0;
    std::string string;
    array_type array;
    object_type object;

    static json_value null_node() { return json_value{}; }

    static json_value bool_node(bool v) {
        json_value n;
        n.k = kind::boolean;
        n.boolean = v;
        return n;
    }

    static json_value integer_node(int64_t v) {
        json_value n;
        n.k = kind::integer;
        n.integer = v;
        return n;
    }

    static json_value number_node(double v) {
        json_value n;
        n.k = kind::number;
        n.number = v;
        return n;
    }

    static json_value string_node(std::string v) {
        json_value n;
        n.k = kind::string;
        n.string = std::move(v);
        return n;
    }

    static json_value array_node() {
        json_value n;
        n.k = kind::array;
        return n;
    }

    static json_value object_node() {
        json_value n;
        n.k = kind::object;
        return n;
    }

    bool is_null() const noexcept { return k == kind::null; }
    bool is_object() const noexcept { return k == kind::object; }
    bool is_array() const noexcept { return k == kind::array; }

    // Linear lookup; objects decoded from real documents are small.
    const json_value* find(std::string_view key) const noexcept {
        for (const auto& kv : object) {
            if (kv.first == key) {
                return &kv.second;
            }
        }
        return nullptr;
    }
};

std::string_view kind_name(json_value::kind k) noexcept;

} // namespace cppjson::json
