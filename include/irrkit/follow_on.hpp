#pragma once

/// @file include/irrkit/follow_on.hpp
/// @brief Follow-on investment events and portfolio unit batches.
///
/// # Module: Follow-On Values
///
/// ## Responsibility
/// Hold the cash-flow events that follow a base investment. Relative timing
/// ("6 months after the initial investment") is resolved against the base
/// date exactly once, inside `make()`. The resulting value carries only an
/// absolute date, so a stored event can never drift with the wall clock.
///
/// ## Guarantees
/// - Instances are immutable once built
/// - `make()` never throws; invalid input yields `std::nullopt`
/// - Every constructed FollowOnInvestment has `amount() > 0`
///
/// ## NOT Responsible For
/// - Checking the event against the base date (see validation.hpp)
/// - Any rate computation (see blended.hpp, growth.hpp)

#include "irrkit/types.hpp"

#include <optional>
#include <variant>

namespace irrkit {

// ─── Timing ───────────────────────────────────────────────────────────────────

/// Event happens on a fixed calendar date.
struct AbsoluteTiming {
    Date date;
};

/// Event happens `amount` units after the base investment date.
///
/// Resolution rules:
///   Days   → base + trunc(amount) days
///   Months → base + trunc(amount) calendar months (day clamped)
///   Years  → base + trunc(amount × 365.25) days
struct RelativeTiming {
    double   amount = 0.0;
    TimeUnit unit   = TimeUnit::Years;
};

using Timing = std::variant<AbsoluteTiming, RelativeTiming>;

/// Resolve a timing to an absolute date against `base_date`.
///
/// # Returns
/// `nullopt` if the relative amount is negative, non-finite or longer than
/// `MAX_OFFSET_YEARS`, or if either date is not a valid calendar date.
[[nodiscard]] std::optional<Date>
resolve_timing(const Timing& timing, Date base_date) noexcept;

// ─── FollowOnInvestment ───────────────────────────────────────────────────────

/// Construction parameters for a FollowOnInvestment.
struct FollowOnSpec {
    Timing         timing{RelativeTiming{}};
    InvestmentType investment_type = InvestmentType::Buy;
    double         amount          = 0.0;
    ValuationMode  valuation_mode  = ValuationMode::TagAlong;
    ValuationType  valuation_type  = ValuationType::Computed;
    double         valuation       = 0.0; ///< Custom/Specified valuation
    double         custom_irr      = 0.0; ///< Custom/Computed rate (decimal)
};

/// An immutable follow-on cash-flow event with a resolved absolute date.
class FollowOnInvestment {
public:
    /// Build a follow-on event, resolving its timing against `base_date`.
    ///
    /// # Returns
    /// `nullopt` if `amount` is not a finite positive number, the timing
    /// cannot be resolved, or `valuation` / `custom_irr` are non-finite.
    [[nodiscard]] static std::optional<FollowOnInvestment>
    make(const FollowOnSpec& spec, Date base_date) noexcept;

    [[nodiscard]] Date           date()            const noexcept { return date_; }
    [[nodiscard]] const Timing&  timing()          const noexcept { return timing_; }
    [[nodiscard]] InvestmentType investment_type() const noexcept { return investment_type_; }
    [[nodiscard]] double         amount()          const noexcept { return amount_; }
    [[nodiscard]] ValuationMode  valuation_mode()  const noexcept { return valuation_mode_; }
    [[nodiscard]] ValuationType  valuation_type()  const noexcept { return valuation_type_; }
    [[nodiscard]] double         valuation()       const noexcept { return valuation_; }
    [[nodiscard]] double         custom_irr()      const noexcept { return custom_irr_; }

    /// True for Custom events whose valuation is derived from `custom_irr`.
    [[nodiscard]] bool is_custom_computed() const noexcept {
        return valuation_mode_ == ValuationMode::Custom
            && valuation_type_ == ValuationType::Computed;
    }

    /// True for Custom events with a literal valuation.
    [[nodiscard]] bool is_custom_specified() const noexcept {
        return valuation_mode_ == ValuationMode::Custom
            && valuation_type_ == ValuationType::Specified;
    }

private:
    FollowOnInvestment(const FollowOnSpec& spec, Date resolved) noexcept;

    Timing         timing_;
    Date           date_;
    InvestmentType investment_type_;
    double         amount_;
    ValuationMode  valuation_mode_;
    ValuationType  valuation_type_;
    double         valuation_;
    double         custom_irr_;
};

// ─── PortfolioUnitBatch ───────────────────────────────────────────────────────

/// One purchase of fractional units (leads, royalties, claims) at a date.
struct PortfolioUnitBatch {
    double investment_amount; ///< Capital spent on this batch (> 0)
    double unit_price;        ///< Price per unit for this batch (> 0)
    Date   investment_date;   ///< When the batch was bought

    /// Units bought: investment_amount / unit_price.
    [[nodiscard]] double units() const noexcept {
        return investment_amount / unit_price;
    }

    /// True when both amount and price are finite and positive.
    [[nodiscard]] bool valid() const noexcept;

    /// Build a batch, rejecting non-positive or non-finite amount or price.
    [[nodiscard]] static std::optional<PortfolioUnitBatch>
    make(double investment_amount, double unit_price, Date investment_date) noexcept;
};

} // namespace irrkit
