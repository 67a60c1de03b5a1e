#pragma once

#include <ostream>
#include <string>

namespace cppjson_cli {

struct options {
    std::string name = "Foo"; // root struct name
    std::string pkg = "main"; // accepted for compatibility, not used by the generator
    bool floats = false;      // every JSON number becomes float
    bool verbose = false;
};

void write_usage(std::ostream& out);
[[noreturn]] void print_usage(int exit_code);
options parse_args(int argc, char** argv);

} // namespace cppjson_cli
