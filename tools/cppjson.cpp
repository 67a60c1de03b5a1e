#include "cppjson/core/generate.hpp"
#include "cppjson/options.hpp"

#include <iostream>
#include <string>
#include <system_error>
#include <unistd.h>

using cppjson::error_code;
using namespace cppjson_cli;

namespace {

std::string error_message(const std::error_code& ec, const std::string& detail) {
    std::string base;
    if (ec == error_code::invalid_json) {
        base = "invalid JSON";
    } else if (ec == error_code::unsupported_shape) {
        base = "unsupported document shape";
    } else {
        base = ec.message();
    }
    if (detail.empty()) {
        return base;
    }
    return base + ": " + detail;
}

int run(const options& opts) {
    if (::isatty(STDIN_FILENO)) {
        write_usage(std::cerr);
        std::cerr << "Expects input on stdin\n";
        return 1;
    }

    cppjson::generate_options gen;
    gen.struct_name = opts.name;
    gen.infer.integer_inference = !opts.floats;

    std::string detail;
    auto out = cppjson::generate(std::cin, gen, &detail);
    if (!out) {
        std::cerr << "[cppjson] error parsing input: " << error_message(out.error(), detail)
                  << "\n";
        return 1;
    }

    std::cout << out->text;
    std::cout.flush();
    if (!std::cout) {
        std::cerr << "[cppjson] failed to write output\n";
        return 1;
    }

    if (opts.verbose) {
        std::cerr << "[cppjson] OK: structs=" << out->stats.structs
                  << ", fields=" << out->stats.fields << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    return run(opts);
}
