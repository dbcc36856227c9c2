#pragma once

/// @file include/irrkit/portfolio.hpp
/// @brief Portfolio Unit Engine: success-rate weighted unit investments.
///
/// # Module: Portfolio Unit Engine
///
/// ## Responsibility
/// Price investments that buy discrete units (leads, royalties, claims) of
/// which only a fraction succeed:
///
///     units            = amount / unit_price
///     successful_units = units × success_rate / 100
///     net_per_unit     = outcome_per_unit × investor_share / 100
///                                         × (1 − fee_percentage / 100)
///     total_outcome    = successful_units × net_per_unit
///     rate             = irr(amount, total_outcome, years)
///
/// The blended variant pools units from several batches (each at its own
/// unit price) and runs the pipeline once. Batch timing does not enter the
/// rate.
///
/// ## Guarantees
/// - Percentages outside [0, 100] are invalid (result 0.0), never clamped
/// - Never throws
///
/// ## NOT Responsible For
/// - Monthly trajectories (see growth.hpp)

#include "irrkit/follow_on.hpp"

#include <optional>
#include <span>

namespace irrkit::portfolio {

/// Outcome parameters shared by single and blended portfolio calculations.
struct UnitTerms {
    double success_rate     = 0.0; ///< % of units that pay out, [0, 100]
    double outcome_per_unit = 0.0; ///< Payout per successful unit
    double investor_share   = 100.0; ///< % of payout to the investor, [0, 100]
    double fee_percentage   = 0.0; ///< % fees taken from the payout, [0, 100]
};

/// True when every percentage in `terms` lies in [0, 100] and all fields
/// are finite.
[[nodiscard]] bool terms_valid(const UnitTerms& terms) noexcept;

/// Net payout per successful unit after investor share and fees.
[[nodiscard]] double net_outcome_per_unit(const UnitTerms& terms) noexcept;

/// Total terminal value of `units` under `terms`.
///
/// # Returns
/// The value, or 0.0 if `units` is non-positive or `terms` are invalid.
[[nodiscard]] double total_outcome(double units, const UnitTerms& terms) noexcept;

/// IRR of a single unit purchase.
///
/// # Returns
/// 0.0 unless `investment_amount > 0`, `unit_price > 0`, `years > 0` and
/// the terms are valid.
[[nodiscard]] double unit_irr(double investment_amount, double unit_price,
                              const UnitTerms& terms, double years) noexcept;

/// Totals pooled over an initial batch and its follow-on batches.
struct PooledUnits {
    double total_investment; ///< Σ batch amounts
    double total_units;      ///< Σ batch amount / batch price
};

/// Pool amounts and units over every batch.
///
/// # Returns
/// `nullopt` if any batch has a non-positive or non-finite amount or price.
[[nodiscard]] std::optional<PooledUnits>
pool_batches(const PortfolioUnitBatch& initial_batch,
             std::span<const PortfolioUnitBatch> follow_on_batches) noexcept;

/// IRR of several unit purchases treated as one pool.
///
/// # Returns
/// 0.0 if pooling fails, `years ≤ 0`, or the terms are invalid.
[[nodiscard]] double
blended_unit_irr(const PortfolioUnitBatch& initial_batch,
                 std::span<const PortfolioUnitBatch> follow_on_batches,
                 const UnitTerms& terms, double years) noexcept;

} // namespace irrkit::portfolio
