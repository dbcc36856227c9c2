/// @file src/cli/args.cpp
/// @brief Positional argument parsing implementation.

#include "args.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>

namespace irrkit::cli {

using namespace irrkit::core;

std::optional<double> parse_number(std::string_view token) {
    double value = 0.0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    if (!std::isfinite(value))           return std::nullopt;
    return value;
}

std::optional<std::vector<double>>
parse_numbers(const std::vector<std::string>& tokens) {
    std::vector<double> values;
    values.reserve(tokens.size());
    for (const auto& t : tokens) {
        auto v = parse_number(t);
        if (!v) {
            fmt::print(stderr, "Error: '{}' is not a number\n", t);
            return std::nullopt;
        }
        values.push_back(*v);
    }
    return values;
}

std::optional<CalculationRequest>
build_request(std::string_view mode, const std::vector<double>& v) {
    if (mode == "--irr" && v.size() == 3) {
        return IrrRequest{v[0], v[1], v[2]};
    }
    if (mode == "--outcome" && v.size() == 3) {
        return OutcomeRequest{v[0], v[1], v[2]};
    }
    if (mode == "--initial" && v.size() == 3) {
        return InitialInvestmentRequest{v[0], v[1], v[2]};
    }
    if (mode == "--portfolio" && (v.size() == 6 || v.size() == 7)) {
        return PortfolioUnitRequest{
            .investment_amount = v[0],
            .unit_price        = v[1],
            .success_rate      = v[2],
            .outcome_per_unit  = v[3],
            .investor_share    = v[4],
            .years             = v[5],
            .fee_percentage    = v.size() == 7 ? v[6] : 0.0,
        };
    }
    return std::nullopt;
}

} // namespace irrkit::cli
