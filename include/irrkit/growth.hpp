#pragma once

/// @file include/irrkit/growth.hpp
/// @brief Growth Projection Engine: monthly valuation trajectories.
///
/// # Module: Growth Projection Engine
///
/// ## Responsibility
/// Turn a resolved rate into a month-by-month value series for charting:
///
///     value(m) = initial × (1 + rate)^(m / 12),   m = 0 … floor(years × 12)
///
/// The follow-on variant overlays one term per event that has started by
/// month m, growing from the event's own date (`elapsed` years after the
/// base date):
///
///     ± amount × (1 + r_event)^(m / 12 − elapsed)
///
/// A term starts at the first month boundary on or after the event date,
/// and only once its exponent is non-negative.
///
/// `+` for Buy and BuySell, `−` for Sell. `r_event` follows the same
/// TagAlong / Custom distinction as the blended engine.
///
/// ## Guarantees
/// - Series length is `total_months(years) + 1`; month indices 0, 1, 2, …
/// - First point of a plain series equals `initial` exactly
/// - Deterministic: each point depends only on the inputs
/// - Never throws (beyond std::bad_alloc from the result vector)
///
/// ## NOT Responsible For
/// - Choosing the rate (callers pass the output of rates / blended /
///   portfolio)

#include "irrkit/follow_on.hpp"
#include "irrkit/portfolio.hpp"
#include "irrkit/types.hpp"

#include <span>

namespace irrkit::growth {

/// floor(years × 12), clamped to [0, MAX_PROJECTION_MONTHS].
///
/// Non-finite or non-positive `years` give 0 (a single-point series).
[[nodiscard]] int total_months(double years) noexcept;

/// Plain compounding trajectory of `initial` at `rate`.
[[nodiscard]] GrowthSeries
growth_points(double initial, double rate, double years);

/// Growth rate applied to one follow-on's overlay term.
///
/// # Arguments
/// * `follow_on`: The event
/// * `initial`  : Base investment amount
/// * `rate`     : Base trajectory rate
/// * `years`    : Total duration
/// * `elapsed`  : Years from the base date to the event
///
/// # Returns
///   - TagAlong         → `rate`
///   - Custom/Computed  → `custom_irr` (or `rate` if ≤ −1)
///   - Custom/Specified → `(initial(1+rate)^years / valuation)^(1/(years−elapsed)) − 1`,
///                        or `rate` when valuation ≤ 0 or no time remains
[[nodiscard]] double
event_rate(const FollowOnInvestment& follow_on, double initial, double rate,
           double years, double elapsed) noexcept;

/// Base trajectory plus follow-on overlays.
///
/// Events dated before `initial_date` are not valid input and contribute
/// nothing.
[[nodiscard]] GrowthSeries
growth_points_with_follow_ons(double initial, double rate, double years,
                              std::span<const FollowOnInvestment> follow_ons,
                              Date initial_date);

/// Trajectory of a single portfolio unit purchase growing at its unit IRR.
[[nodiscard]] GrowthSeries
portfolio_unit_growth_points(double investment_amount, double unit_price,
                             const portfolio::UnitTerms& terms, double years);

/// Trajectory of a pooled portfolio: the initial batch plus each follow-on
/// batch from its own start month, all growing at the blended unit IRR.
///
/// Batches dated before `initial_date` contribute nothing.
[[nodiscard]] GrowthSeries
portfolio_blended_growth_points(const PortfolioUnitBatch& initial_batch,
                                std::span<const PortfolioUnitBatch> follow_on_batches,
                                const portfolio::UnitTerms& terms, double years,
                                Date initial_date);

} // namespace irrkit::growth
