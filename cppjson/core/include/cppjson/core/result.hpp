#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace cppjson {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    invalid_json = 1,
    unsupported_shape = 2,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "cppjson"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::invalid_json:
            return "invalid JSON document";
        case ec::unsupported_shape:
            return "top-level value must be an object or a non-empty array of objects";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace cppjson

namespace std {
template <> struct is_error_code_enum<cppjson::error_code> : true_type {};
} // namespace std
