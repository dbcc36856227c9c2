#pragma once

#include <cstddef>

/// @file include/irrkit/constants.hpp
/// @brief Calendar and numeric constants shared by every IRRKit module.

namespace irrkit::constants {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// Months in a year. Growth series are sampled once per month.
static constexpr double MONTHS_PER_YEAR = 12.0;

/// Longest growth series the projection engine materialises (1000 years).
static constexpr int MAX_PROJECTION_MONTHS = 12000;

/// Mean Julian year length, used to turn day counts into fractional years.
static constexpr double DAYS_PER_YEAR = 365.25;

/// Longest relative follow-on offset accepted, in years.
static constexpr double MAX_OFFSET_YEARS = 1000.0;

// ─── Percentages ──────────────────────────────────────────────────────────────

/// Divisor applied to percentage inputs (success rate, share, fees).
static constexpr double PERCENT_SCALE = 100.0;

/// Lower inclusive bound for percentage inputs.
static constexpr double MIN_PERCENTAGE = 0.0;

/// Upper inclusive bound for percentage inputs.
static constexpr double MAX_PERCENTAGE = 100.0;

// ─── Rate Bounds (validation only) ────────────────────────────────────────────

/// Exclusive lower bound for a user-supplied rate: −100% wipes out capital.
static constexpr double MIN_RATE = -1.0;

/// Exclusive upper bound for a user-supplied rate (1000%).
static constexpr double MAX_RATE = 10.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Tolerance used when comparing derived rates (round-trip checks).
static constexpr double RATE_EPSILON = 1e-6;

} // namespace irrkit::constants
