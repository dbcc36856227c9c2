#pragma once

/// @file include/irrkit/request.hpp
/// @brief Calculation requests: one variant alternative per calculation mode.
///
/// A request is a `std::variant`; the engine dispatches on it with
/// `std::visit`. Requests are plain aggregates built by the caller, consumed
/// once, and never modified by the engine.

#include "irrkit/follow_on.hpp"
#include "irrkit/portfolio.hpp"
#include "irrkit/types.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace irrkit::core {

// ─── Request Alternatives ─────────────────────────────────────────────────────

/// Solve for the rate: (initial, outcome, years) → irr.
struct IrrRequest {
    double initial = 0.0;
    double outcome = 0.0;
    double years   = 0.0;
};

/// Solve for the terminal value: (initial, irr, years) → outcome.
struct OutcomeRequest {
    double initial = 0.0;
    double irr     = 0.0; ///< Decimal rate
    double years   = 0.0;
};

/// Solve for the required capital: (outcome, irr, years) → initial.
struct InitialInvestmentRequest {
    double outcome = 0.0;
    double irr     = 0.0; ///< Decimal rate
    double years   = 0.0;
};

/// Base investment plus follow-on events → blended irr.
struct BlendedIrrRequest {
    double                          initial = 0.0;
    double                          outcome = 0.0;
    double                          years   = 0.0;
    std::vector<FollowOnInvestment> follow_ons;
    Date                            initial_date{};
};

/// Single portfolio unit purchase → irr.
struct PortfolioUnitRequest {
    double investment_amount = 0.0;
    double unit_price        = 0.0;
    double success_rate      = 0.0;   ///< %
    double outcome_per_unit  = 0.0;
    double investor_share    = 100.0; ///< %
    double years             = 0.0;
    double fee_percentage    = 0.0;   ///< %
};

/// Several portfolio unit batches pooled → blended irr.
struct PortfolioUnitBlendedRequest {
    PortfolioUnitBatch              initial_batch{0.0, 0.0, Date{}};
    double                          years            = 0.0;
    double                          success_rate     = 0.0;   ///< %
    double                          outcome_per_unit = 0.0;
    double                          investor_share   = 100.0; ///< %
    double                          fee_percentage   = 0.0;   ///< %
    std::vector<PortfolioUnitBatch> follow_on_batches;
    Date                            initial_date{};
};

using CalculationRequest = std::variant<
    IrrRequest,
    OutcomeRequest,
    InitialInvestmentRequest,
    BlendedIrrRequest,
    PortfolioUnitRequest,
    PortfolioUnitBlendedRequest>;

// ─── Modes ────────────────────────────────────────────────────────────────────

enum class CalculationMode {
    Irr,
    Outcome,
    InitialInvestment,
    BlendedIrr,
    PortfolioUnit,
    PortfolioUnitBlended,
};

/// Mode of the active alternative.
[[nodiscard]] CalculationMode mode_of(const CalculationRequest& request) noexcept;

/// Human-readable mode name ("Calculate IRR", ...).
[[nodiscard]] std::string_view to_string(CalculationMode mode) noexcept;

/// True for modes whose result is a rate rather than a monetary amount.
[[nodiscard]] bool yields_rate(CalculationMode mode) noexcept;

/// Portfolio outcome terms carried by a portfolio request.
[[nodiscard]] portfolio::UnitTerms terms_of(const PortfolioUnitRequest& r) noexcept;
[[nodiscard]] portfolio::UnitTerms terms_of(const PortfolioUnitBlendedRequest& r) noexcept;

} // namespace irrkit::core
