#pragma once

#include "json_value.hpp"
#include "result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cppjson::json {

inline constexpr size_t kMaxNestingDepth = 1000;

struct decode_diagnostic {
    size_t offset = 0; // byte offset of the failure
    std::string message;
};

// Decodes the first JSON value in `text`. Anything after that value is left
// unread. Failures return error_code::invalid_json and fill `diag`.
result<json_value> decode(std::string_view text, decode_diagnostic* diag = nullptr);

} // namespace cppjson::json
