#pragma once

/// @file include/irrkit/blended.hpp
/// @brief Blended IRR Engine: one rate over a base investment plus follow-ons.
///
/// # Module: Blended IRR Engine
///
/// ## Responsibility
/// Aggregate a base investment and an ordered list of follow-on events into
/// total invested capital and total terminal value, then price the aggregate
/// with the Core Rate Engine:
///
///     base_rate     = irr(initial, outcome, years)
///     final_outcome = outcome + Σ proceeds(sell, buy/sell events)
///     blended       = irr(initial + Σ buys, final_outcome, years)
///
/// ## Sell Proceeds by Valuation Policy
/// With `t` = years from the base date to the event and
/// `ratio = outcome / (initial × (1 + base_rate)^t)`:
///   - TagAlong         → amount × ratio
///   - Custom/Specified → amount
///   - Custom/Computed  → amount × (1 + custom_irr)^t × ratio,
///                        TagAlong fallback when it cannot be derived
///   - BuySell          → TagAlong proceeds regardless of mode
///
/// ## Guarantees
/// - Follow-ons are processed in ascending resolved-date order
/// - A follow-on dated before the base date invalidates the request (0.0)
/// - Never throws; all failures produce 0.0 or `std::nullopt`
///
/// ## NOT Responsible For
/// - Monthly trajectories (see growth.hpp)

#include "irrkit/follow_on.hpp"
#include "irrkit/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace irrkit::blended {

/// Intermediate aggregates of one blended calculation.
struct BlendedBreakdown {
    double base_rate;      ///< irr(initial, outcome, years)
    double total_invested; ///< initial + every Buy / BuySell amount
    double total_proceeds; ///< Σ proceeds of Sell / BuySell events
    double final_outcome;  ///< outcome + total_proceeds
    double rate;           ///< irr(total_invested, final_outcome, years)
};

/// Copy of `follow_ons` in ascending date order (stable for equal dates).
[[nodiscard]] std::vector<FollowOnInvestment>
sort_by_date(std::span<const FollowOnInvestment> follow_ons);

/// Years from `initial_date` to the event, days / 365.25. Negative when the
/// event precedes the base date.
[[nodiscard]] double
elapsed_years(Date initial_date, const FollowOnInvestment& follow_on) noexcept;

/// Proceeds realised by a Sell or BuySell event at `elapsed` years.
///
/// Buy events realise nothing and return 0.0.
[[nodiscard]] double
event_proceeds(const FollowOnInvestment& follow_on,
               double initial, double outcome, double years,
               double base_rate, double elapsed) noexcept;

/// Full aggregate breakdown.
///
/// # Returns
/// `nullopt` if `initial`, `outcome` or `years` is non-positive or
/// non-finite, `initial_date` is not a valid date, or any follow-on is
/// dated before `initial_date`.
[[nodiscard]] std::optional<BlendedBreakdown>
blended_breakdown(double initial, double outcome, double years,
                  std::span<const FollowOnInvestment> follow_ons,
                  Date initial_date);

/// Blended IRR over the base investment and its follow-ons.
///
/// With an empty `follow_ons` this is exactly `rates::irr(initial, outcome,
/// years)`. Returns 0.0 wherever `blended_breakdown` returns `nullopt`.
[[nodiscard]] double
blended_irr(double initial, double outcome, double years,
            std::span<const FollowOnInvestment> follow_ons,
            Date initial_date);

} // namespace irrkit::blended
