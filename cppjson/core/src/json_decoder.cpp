#include "cppjson/core/json_decoder.hpp"

#include "cppjson/core/utf8.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace cppjson::json {

std::string_view kind_name(json_value::kind k) noexcept {
    switch (k) {
    case json_value::kind::null:
        return "null";
    case json_value::kind::boolean:
        return "boolean";
    case json_value::kind::integer:
        return "integer";
    case json_value::kind::number:
        return "number";
    case json_value::kind::string:
        return "string";
    case json_value::kind::array:
        return "array";
    case json_value::kind::object:
        return "object";
    }
    return "unknown";
}

namespace {

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start;

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    char peek() const noexcept { return eof() ? '\0' : *ptr; }

    // JSON whitespace is exactly space, tab, LF and CR.
    void skip_ws() noexcept {
        while (!eof() && (*ptr == ' ' || *ptr == '\t' || *ptr == '\n' || *ptr == '\r')) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }
};

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

std::string describe_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc >= 0x7F) {
        constexpr std::string_view digits = "0123456789abcdef";
        std::string out = "byte 0x";
        out.push_back(digits[uc >> 4]);
        out.push_back(digits[uc & 0x0F]);
        return out;
    }
    return std::string("character '") + c + "'";
}

class decoder {
public:
    decoder(std::string_view text, decode_diagnostic* diag)
        : cur_(text.data(), text.data() + text.size()), diag_(diag) {}

    std::optional<json_value> run() {
        json_value root;
        if (!parse_value(root)) {
            return std::nullopt;
        }
        return root;
    }

private:
    bool fail(std::string message) {
        if (diag_ && diag_->message.empty()) {
            diag_->offset = cur_.pos();
            diag_->message = std::move(message);
        }
        return false;
    }

    bool fail_unexpected(std::string_view context) {
        if (cur_.eof()) {
            return fail("unexpected end of input");
        }
        return fail("unexpected " + describe_char(*cur_.ptr) + " " + std::string(context));
    }

    bool parse_value(json_value& out) {
        if (++depth_ > kMaxNestingDepth) {
            return fail("exceeded maximum nesting depth");
        }
        bool ok = parse_value_inner(out);
        --depth_;
        return ok;
    }

    bool parse_value_inner(json_value& out) {
        cur_.skip_ws();
        if (cur_.eof()) {
            return fail("unexpected end of input");
        }
        char c = *cur_.ptr;
        switch (c) {
        case 'n':
            if (!parse_literal("null")) {
                return false;
            }
            out = json_value::null_node();
            return true;
        case 't':
            if (!parse_literal("true")) {
                return false;
            }
            out = json_value::bool_node(true);
            return true;
        case 'f':
            if (!parse_literal("false")) {
                return false;
            }
            out = json_value::bool_node(false);
            return true;
        case '\"': {
            std::string s;
            if (!parse_string(s)) {
                return false;
            }
            out = json_value::string_node(std::move(s));
            return true;
        }
        case '[':
            return parse_array(out);
        case '{':
            return parse_object(out);
        default:
            if (c == '-' || is_digit(c)) {
                return parse_number(out);
            }
            return fail_unexpected("looking for beginning of value");
        }
    }

    bool parse_literal(std::string_view word) {
        for (char expected : word) {
            if (cur_.eof() || *cur_.ptr != expected) {
                return fail_unexpected(std::string("in literal ") + std::string(word));
            }
            ++cur_.ptr;
        }
        return true;
    }

    bool parse_number(json_value& out) {
        const char* begin = cur_.ptr;
        bool integral = true;

        if (cur_.peek() == '-') {
            ++cur_.ptr;
        }
        if (cur_.peek() == '0') {
            ++cur_.ptr;
        } else if (is_digit(cur_.peek())) {
            while (is_digit(cur_.peek())) {
                ++cur_.ptr;
            }
        } else {
            return fail_unexpected("in numeric literal");
        }

        if (cur_.peek() == '.') {
            integral = false;
            ++cur_.ptr;
            if (!is_digit(cur_.peek())) {
                return fail_unexpected("after decimal point in numeric literal");
            }
            while (is_digit(cur_.peek())) {
                ++cur_.ptr;
            }
        }

        if (cur_.peek() == 'e' || cur_.peek() == 'E') {
            integral = false;
            ++cur_.ptr;
            if (cur_.peek() == '+' || cur_.peek() == '-') {
                ++cur_.ptr;
            }
            if (!is_digit(cur_.peek())) {
                return fail_unexpected("in exponent of numeric literal");
            }
            while (is_digit(cur_.peek())) {
                ++cur_.ptr;
            }
        }

        const char* stop = cur_.ptr;
        if (integral) {
            int64_t value = 0;
            auto [p, ec] = std::from_chars(begin, stop, value);
            if (ec == std::errc() && p == stop) {
                out = json_value::integer_node(value);
                return true;
            }
            // Too large for int64: fall through to floating point.
        }

        double value = 0.0;
        auto [p, ec] = std::from_chars(begin, stop, value);
        if (ec != std::errc() || p != stop) {
            cur_.ptr = begin;
            return fail("number " + std::string(begin, stop) + " is out of range");
        }
        out = json_value::number_node(value);
        return true;
    }

    bool parse_hex4(char32_t& out) {
        out = 0;
        for (int i = 0; i < 4; ++i) {
            int h = cur_.eof() ? -1 : hex_value(*cur_.ptr);
            if (h < 0) {
                return fail_unexpected("in \\u escape");
            }
            out = (out << 4) | static_cast<char32_t>(h);
            ++cur_.ptr;
        }
        return true;
    }

    bool parse_unicode_escape(std::string& out) {
        char32_t u = 0;
        if (!parse_hex4(u)) {
            return false;
        }
        if (u >= 0xD800 && u <= 0xDBFF) {
            // A high surrogate only combines with an immediately following low one.
            if (cur_.end - cur_.ptr >= 6 && cur_.ptr[0] == '\\' && cur_.ptr[1] == 'u') {
                const char* save = cur_.ptr;
                cur_.ptr += 2;
                char32_t u2 = 0;
                if (!parse_hex4(u2)) {
                    return false;
                }
                if (u2 >= 0xDC00 && u2 <= 0xDFFF) {
                    utf8::append(out, 0x10000 + (((u - 0xD800) << 10) | (u2 - 0xDC00)));
                    return true;
                }
                cur_.ptr = save;
            }
            utf8::append(out, utf8::replacement_char);
            return true;
        }
        if (u >= 0xDC00 && u <= 0xDFFF) {
            utf8::append(out, utf8::replacement_char);
            return true;
        }
        utf8::append(out, u);
        return true;
    }

    bool parse_string(std::string& out) {
        ++cur_.ptr; // opening quote
        std::string_view text(cur_.start, static_cast<size_t>(cur_.end - cur_.start));
        while (!cur_.eof()) {
            char c = *cur_.ptr;
            if (c == '\"') {
                ++cur_.ptr;
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("unescaped control character in string literal");
            }
            if (c == '\\') {
                ++cur_.ptr;
                if (cur_.eof()) {
                    break;
                }
                char e = *cur_.ptr++;
                switch (e) {
                case '\"':
                    out.push_back('\"');
                    break;
                case '\\':
                    out.push_back('\\');
                    break;
                case '/':
                    out.push_back('/');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u':
                    if (!parse_unicode_escape(out)) {
                        return false;
                    }
                    break;
                default:
                    --cur_.ptr;
                    return fail_unexpected("in string escape code");
                }
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x80) {
                out.push_back(c);
                ++cur_.ptr;
                continue;
            }
            // Invalid UTF-8 is kept as U+FFFD.
            char32_t cp = 0;
            cur_.ptr += utf8::decode(text, cur_.pos(), cp);
            utf8::append(out, cp);
        }
        return fail("unexpected end of input in string literal");
    }

    bool parse_array(json_value& out) {
        ++cur_.ptr; // '['
        out = json_value::array_node();
        if (cur_.consume(']')) {
            return true;
        }
        while (true) {
            json_value element;
            if (!parse_value(element)) {
                return false;
            }
            out.array.push_back(std::move(element));
            if (cur_.consume(',')) {
                continue;
            }
            if (cur_.consume(']')) {
                return true;
            }
            return fail_unexpected("after array element");
        }
    }

    bool parse_object(json_value& out) {
        ++cur_.ptr; // '{'
        out = json_value::object_node();
        if (cur_.consume('}')) {
            return true;
        }
        std::unordered_map<std::string, size_t> index;
        while (true) {
            cur_.skip_ws();
            if (cur_.peek() != '\"') {
                return fail_unexpected("looking for beginning of object key string");
            }
            std::string key;
            if (!parse_string(key)) {
                return false;
            }
            if (!cur_.consume(':')) {
                return fail_unexpected("after object key");
            }
            json_value member;
            if (!parse_value(member)) {
                return false;
            }
            auto [it, inserted] = index.try_emplace(key, out.object.size());
            if (inserted) {
                out.object.emplace_back(std::move(key), std::move(member));
            } else {
                out.object[it->second].second = std::move(member);
            }
            if (cur_.consume(',')) {
                continue;
            }
            if (cur_.consume('}')) {
                return true;
            }
            return fail_unexpected("after object key:value pair");
        }
    }

    json_cursor cur_;
    decode_diagnostic* diag_;
    size_t depth_ = 0;
};

} // namespace

result<json_value> decode(std::string_view text, decode_diagnostic* diag) {
    decoder d(text, diag);
    auto root = d.run();
    if (!root) {
        return std::unexpected(make_error_code(error_code::invalid_json));
    }
    return std::move(*root);
}

} // namespace cppjson::json
