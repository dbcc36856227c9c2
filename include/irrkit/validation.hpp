#pragma once

/// @file include/irrkit/validation.hpp
/// @brief Strict input validation for calculation requests.
///
/// # Module: Validation
///
/// ## Responsibility
/// The rate engines signal invalid input with a silent 0.0, which a caller
/// cannot tell apart from a genuine zero. This module applies the same
/// predicates up front and reports each failed one by field name, so a UI
/// can explain the problem before calling the engine.
///
/// ## Rules
/// - Amounts (initial, outcome, unit price, outcome per unit) must be > 0
/// - Durations must be > 0
/// - User-supplied rates must lie in (−1, 10), i.e. (−100%, 1000%)
/// - Success rate, investor share and fees must lie in [0, 100]
/// - Follow-ons and follow-on batches may not predate the initial
///   investment date
/// - Custom/Specified valuations must be > 0
/// - Custom/Computed rates follow the user-supplied rate bounds
/// - Every numeric field must be finite

#include "irrkit/request.hpp"

#include <string>
#include <vector>

namespace irrkit::validation {

/// One failed validation rule.
struct ValidationIssue {
    std::string field;   ///< Request field, e.g. "years" or "follow_ons[1].date"
    std::string message; ///< Human-readable explanation
};

/// Check every rule that applies to the request's mode.
///
/// # Returns
/// All failed rules in field order; empty when the request is valid.
[[nodiscard]] std::vector<ValidationIssue>
validate(const core::CalculationRequest& request);

/// `validate(request).empty()`.
[[nodiscard]] bool is_valid(const core::CalculationRequest& request);

/// Single-field predicates.
[[nodiscard]] bool is_positive(double x) noexcept;
[[nodiscard]] bool is_percentage(double x) noexcept;
[[nodiscard]] bool is_rate(double x) noexcept;

} // namespace irrkit::validation
