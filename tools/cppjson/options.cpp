#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string_view>

namespace cppjson_cli {

namespace {

bool parse_bool_flag(std::string_view flag, std::optional<std::string_view> value) {
    if (!value || *value == "true" || *value == "1") {
        return true;
    }
    if (*value == "false" || *value == "0") {
        return false;
    }
    std::cerr << "[cppjson] invalid boolean value \"" << *value << "\" for flag -" << flag
              << "\n";
    print_usage(1);
}

} // namespace

void write_usage(std::ostream& out) {
    out << R"(cppjson: generate C++ struct declarations from a JSON document

Usage:
  cppjson [-name=<struct>] [-pkg=<package>] [-floats] [-v] < input.json

Example:
  curl -s https://api.github.com/repos/octocat/hello-world | cppjson -name=Repository

Options:
  -name <string>   Name of the root struct (default: Foo)
  -pkg <string>    Package name; accepted and ignored (default: main)
  -floats          Infer every JSON number as float, including integer literals
  -v               Log a summary line to stderr
  -h, --help       Show this help

Reads JSON from stdin and prints the declarations to stdout.
)";
}

[[noreturn]] void print_usage(int exit_code) {
    write_usage(std::cerr);
    std::exit(exit_code);
}

options parse_args(int argc, char** argv) {
    options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.size() < 2 || arg.front() != '-') {
            std::cerr << "[cppjson] unexpected argument: " << arg << "\n";
            print_usage(1);
        }
        arg.remove_prefix(arg.starts_with("--") ? 2 : 1);

        std::optional<std::string_view> value;
        if (auto eq = arg.find('='); eq != std::string_view::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto take_value = [&]() -> std::string {
            if (value) {
                return std::string(*value);
            }
            if (i + 1 >= argc) {
                std::cerr << "[cppjson] flag needs an argument: -" << arg << "\n";
                print_usage(1);
            }
            return argv[++i];
        };

        if (arg == "h" || arg == "help") {
            print_usage(0);
        } else if (arg == "name") {
            opts.name = take_value();
        } else if (arg == "pkg") {
            opts.pkg = take_value();
        } else if (arg == "floats") {
            opts.floats = parse_bool_flag(arg, value);
        } else if (arg == "v") {
            opts.verbose = parse_bool_flag(arg, value);
        } else {
            std::cerr << "[cppjson] flag provided but not defined: -" << arg << "\n";
            print_usage(1);
        }
    }
    return opts;
}

} // namespace cppjson_cli
