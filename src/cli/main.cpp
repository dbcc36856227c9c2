/// @file src/cli/main.cpp
/// @brief IRRKit CLI entry point.
///
/// Usage:
///   irrkit --irr <initial> <outcome> <years>
///   irrkit --outcome <initial> <irr> <years>
///   irrkit --initial <outcome> <irr> <years>
///   irrkit --portfolio <amount> <unit_price> <success%> <outcome_per_unit>
///                      <share%> <years> [fee%]
///   irrkit --help
///
/// Options (anywhere on the line):
///   --growth    Print the monthly growth series
///   --strict    Validate inputs and report problems instead of printing 0
///   --verbose   Engine diagnostics on stderr

#include "args.hpp"
#include "irrkit/engine.hpp"
#include "irrkit/validation.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using namespace irrkit::core;
using irrkit::cli::build_request;
using irrkit::cli::parse_numbers;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  irrkit --irr <initial> <outcome> <years>\n"
        "  irrkit --outcome <initial> <irr> <years>\n"
        "  irrkit --initial <outcome> <irr> <years>\n"
        "  irrkit --portfolio <amount> <unit_price> <success%> <outcome_per_unit>\n"
        "                     <share%> <years> [fee%]\n"
        "  irrkit --help\n"
        "\n"
        "Options:\n"
        "  --growth    Print the monthly growth series\n"
        "  --strict    Reject invalid inputs with an explanation\n"
        "  --verbose   Engine diagnostics on stderr\n"
        "\n"
        "Rates are decimal fractions (0.15 for 15%).\n"
    );
}

void print_growth(const CalculationResult& result) {
    fmt::print("month,value\n");
    for (const auto& p : result.growth) {
        fmt::print("{},{:.2f}\n", p.month, p.value);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    EngineConfig config;
    config.include_growth = false;
    bool strict = false;

    std::string mode;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--growth")  { config.include_growth = true; continue; }
        if (arg == "--strict")  { strict = true;                continue; }
        if (arg == "--verbose") { config.verbose = true;        continue; }
        if (arg.rfind("--", 0) == 0 && mode.empty()) { mode = arg; continue; }
        positional.push_back(arg);
    }

    if (mode.empty()) {
        fmt::print(stderr, "Error: no calculation mode given\n");
        print_usage();
        return 1;
    }

    const auto values = parse_numbers(positional);
    if (!values) return 1;

    const auto request = build_request(mode, *values);
    if (!request) {
        fmt::print(stderr, "Error: wrong arguments for {}\n", mode);
        print_usage();
        return 1;
    }

    const Engine engine(config);

    const auto result = strict ? engine.try_calculate(*request)
                               : std::optional{engine.calculate(*request)};
    if (!result) {
        for (const auto& issue : irrkit::validation::validate(*request)) {
            fmt::print(stderr, "Invalid {}: {}\n", issue.field, issue.message);
        }
        return 1;
    }

    fmt::print("{}\n", result->to_string());
    if (config.include_growth) print_growth(*result);
    return 0;
}
