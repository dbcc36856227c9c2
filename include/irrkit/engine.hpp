#pragma once

/// @file include/irrkit/engine.hpp
/// @brief Calculation Engine: dispatches a request to the rate engines.
///
/// # Module: Calculation Engine
///
/// ## Responsibility
/// Accept one `CalculationRequest`, route it to the matching engine, and
/// return the scalar result together with the growth series for charting:
///
///   IrrRequest                  → rates::irr            + growth_points
///   OutcomeRequest              → rates::future_value   + growth_points
///   InitialInvestmentRequest    → rates::present_value  + growth_points
///   BlendedIrrRequest           → blended::blended_irr  + growth_points_with_follow_ons
///   PortfolioUnitRequest        → portfolio::unit_irr   + portfolio_unit_growth_points
///   PortfolioUnitBlendedRequest → portfolio::blended_unit_irr
///                                                       + portfolio_blended_growth_points
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto result = engine.calculate(IrrRequest{100.0, 150.0, 2.0});
/// fmt::print("{}\n", result.to_string());   // 22.4745%
/// ```
///
/// ## Guarantees
/// - `calculate` never fails: invalid input yields `value == 0.0`
/// - `try_calculate` returns `nullopt` for any request that fails
///   validation, so rejected input is distinguishable from a computed 0.0
/// - Thread-safe: both entry points are const and hold no mutable state
///
/// ## NOT Responsible For
/// - Persisting, importing or exporting calculations
/// - Formatting beyond the diagnostic `to_string()`

#include "irrkit/request.hpp"
#include "irrkit/types.hpp"

#include <optional>
#include <string>

namespace irrkit::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for the calculation engine.
struct EngineConfig {
    /// If false, results carry an empty growth series.
    bool include_growth = true;

    /// If true, emit one diagnostic line per calculation to stderr.
    bool verbose = false;
};

// ─── CalculationResult ────────────────────────────────────────────────────────

/// Output of one calculation.
struct CalculationResult {
    CalculationMode mode;   ///< Mode of the request that produced this
    double          value;  ///< Decimal rate or monetary amount, 0.0 if invalid
    GrowthSeries    growth; ///< Month 0 … floor(years × 12), or empty

    /// Summary line; rates are shown as percentages.
    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

/// Stateless dispatcher over the IRRKit calculation engines.
class Engine {
public:
    /// Construct with optional configuration.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Compute a request. Invalid inputs produce `value == 0.0`.
    [[nodiscard]] CalculationResult
    calculate(const CalculationRequest& request) const;

    /// Validate first, then compute.
    ///
    /// # Returns
    /// `nullopt` if `validation::validate(request)` reports any issue.
    [[nodiscard]] std::optional<CalculationResult>
    try_calculate(const CalculationRequest& request) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

} // namespace irrkit::core
