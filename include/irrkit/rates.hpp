#pragma once

/// @file include/irrkit/rates.hpp
/// @brief Core Rate Engine: closed-form IRR, future value, present value.
///
/// # Module: Core Rate Engine
///
/// ## Responsibility
/// The single rate formula used everywhere in IRRKit. Blended and portfolio
/// engines aggregate cash flows and then call `irr()` here; no other module
/// carries its own rate formula.
///
/// ## Core Formulas
/// ```
/// irr           = (outcome / initial)^(1 / years) − 1
/// future_value  = initial × (1 + rate)^years
/// present_value = outcome / (1 + rate)^years
/// ```
///
/// ## Guarantees
/// - Total functions: a failed precondition returns 0.0, never throws
/// - Non-finite inputs or results are mapped to 0.0
/// - Rates are decimal fractions (0.15 for 15%); no percentage scaling
///
/// ## NOT Responsible For
/// - Follow-on aggregation (see blended.hpp)
/// - Reporting why a result is zero (see validation.hpp)

namespace irrkit::rates {

/// Annualised internal rate of return.
///
/// # Arguments
/// * `initial`: Capital invested (> 0)
/// * `outcome`: Terminal value (> 0)
/// * `years`  : Holding period (> 0)
///
/// # Returns
/// The decimal rate, or 0.0 if any argument is non-positive or non-finite.
[[nodiscard]] double irr(double initial, double outcome, double years) noexcept;

/// Terminal value of `initial` compounded at `rate` for `years`.
///
/// # Returns
/// The value, or 0.0 unless `initial > 0` and `years ≥ 0`.
[[nodiscard]] double future_value(double initial, double rate, double years) noexcept;

/// Capital required today to reach `outcome` at `rate` after `years`.
///
/// # Returns
/// The value, or 0.0 unless `outcome > 0` and `years ≥ 0`. Also 0.0 when
/// the discount factor (1 + rate)^years is zero.
[[nodiscard]] double present_value(double outcome, double rate, double years) noexcept;

/// Growth multiple (1 + rate)^years. No guards; callers check inputs.
[[nodiscard]] double growth_factor(double rate, double years) noexcept;

} // namespace irrkit::rates
