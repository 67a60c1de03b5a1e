#include "cppjson/core/generate.hpp"

#include "cppjson/core/json_decoder.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace cppjson {

namespace {

void set_detail(std::string* detail, std::string message) {
    if (detail) {
        *detail = std::move(message);
    }
}

} // namespace

result<const json::json_value*> select_root(const json::json_value& document,
                                            std::string* detail) {
    if (document.is_object()) {
        return &document;
    }
    if (!document.is_array()) {
        set_detail(detail, "unexpected type: " + std::string(json::kind_name(document.k)));
        return std::unexpected(make_error_code(error_code::unsupported_shape));
    }
    if (document.array.empty()) {
        set_detail(detail, "empty array");
        return std::unexpected(make_error_code(error_code::unsupported_shape));
    }
    for (size_t i = 0; i < document.array.size(); ++i) {
        const auto& item = document.array[i];
        if (!item.is_object()) {
            set_detail(detail,
                       "unexpected array element type: " + std::string(json::kind_name(item.k)) +
                           " at index " + std::to_string(i));
            return std::unexpected(make_error_code(error_code::unsupported_shape));
        }
    }
    return &document.array.front();
}

result<generation>
generate(std::string_view input, const generate_options& opts, std::string* detail) {
    json::decode_diagnostic diag;
    auto document = json::decode(input, &diag);
    if (!document) {
        set_detail(detail, diag.message + " at offset " + std::to_string(diag.offset));
        return std::unexpected(document.error());
    }

    auto root = select_root(*document, detail);
    if (!root) {
        return std::unexpected(root.error());
    }

    auto type = schema::infer_struct(opts.struct_name, **root, opts.infer);

    generation out;
    out.stats = schema::collect_stats(type);
    out.text = render_struct(type, opts.render);
    return out;
}

result<generation>
generate(std::istream& input, const generate_options& opts, std::string* detail) {
    std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        set_detail(detail, "failed to read input");
        return std::unexpected(make_error_code(error_code::invalid_json));
    }
    return generate(std::string_view(text), opts, detail);
}

} // namespace cppjson
