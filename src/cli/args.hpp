#pragma once

/// @file src/cli/args.hpp
/// @brief Positional argument parsing for the irrkit executable.

#include "irrkit/request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace irrkit::cli {

/// Parse a whole token as a finite double.
/// Trailing characters, NaN and infinities yield nullopt.
[[nodiscard]] std::optional<double> parse_number(std::string_view token);

/// Parse every positional argument; reports the first bad token on stderr.
[[nodiscard]] std::optional<std::vector<double>>
parse_numbers(const std::vector<std::string>& tokens);

/// Build a request for `mode` from its positional values.
///
/// `--irr`, `--outcome` and `--initial` take exactly three values.
/// `--portfolio` takes six, plus an optional fee percentage that defaults
/// to 0. Any other mode or count yields nullopt.
[[nodiscard]] std::optional<core::CalculationRequest>
build_request(std::string_view mode, const std::vector<double>& v);

} // namespace irrkit::cli
