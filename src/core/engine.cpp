/// @file src/core/engine.cpp
/// @brief Calculation Engine: request dispatch.

#include "irrkit/engine.hpp"
#include "irrkit/blended.hpp"
#include "irrkit/growth.hpp"
#include "irrkit/portfolio.hpp"
#include "irrkit/rates.hpp"
#include "irrkit/validation.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace irrkit::core {

namespace {

/// Visitor: one overload per request alternative.
struct Dispatch {
    bool include_growth;

    CalculationResult operator()(const IrrRequest& r) const {
        const double rate = rates::irr(r.initial, r.outcome, r.years);
        return {CalculationMode::Irr, rate,
                series([&] { return growth::growth_points(r.initial, rate, r.years); })};
    }

    CalculationResult operator()(const OutcomeRequest& r) const {
        const double value = rates::future_value(r.initial, r.irr, r.years);
        return {CalculationMode::Outcome, value,
                series([&] { return growth::growth_points(r.initial, r.irr, r.years); })};
    }

    CalculationResult operator()(const InitialInvestmentRequest& r) const {
        const double value = rates::present_value(r.outcome, r.irr, r.years);
        return {CalculationMode::InitialInvestment, value,
                series([&] { return growth::growth_points(value, r.irr, r.years); })};
    }

    CalculationResult operator()(const BlendedIrrRequest& r) const {
        const double rate = blended::blended_irr(r.initial, r.outcome, r.years,
                                                 r.follow_ons, r.initial_date);
        return {CalculationMode::BlendedIrr, rate, series([&] {
            return growth::growth_points_with_follow_ons(
                r.initial, rate, r.years, r.follow_ons, r.initial_date);
        })};
    }

    CalculationResult operator()(const PortfolioUnitRequest& r) const {
        const auto terms = terms_of(r);
        const double rate = portfolio::unit_irr(r.investment_amount, r.unit_price,
                                                terms, r.years);
        return {CalculationMode::PortfolioUnit, rate, series([&] {
            return growth::portfolio_unit_growth_points(
                r.investment_amount, r.unit_price, terms, r.years);
        })};
    }

    CalculationResult operator()(const PortfolioUnitBlendedRequest& r) const {
        const auto terms = terms_of(r);
        const double rate = portfolio::blended_unit_irr(
            r.initial_batch, r.follow_on_batches, terms, r.years);
        return {CalculationMode::PortfolioUnitBlended, rate, series([&] {
            return growth::portfolio_blended_growth_points(
                r.initial_batch, r.follow_on_batches, terms, r.years,
                r.initial_date);
        })};
    }

    template <typename Fn>
    GrowthSeries series(Fn&& make) const {
        if (!include_growth) return {};
        return make();
    }
};

} // namespace

// ─── CalculationResult ────────────────────────────────────────────────────────

std::string CalculationResult::to_string() const {
    if (yields_rate(mode)) {
        return fmt::format("{}: {:.4f}%  ({} growth points)",
                           core::to_string(mode), value * 100.0, growth.size());
    }
    return fmt::format("{}: {:.2f}  ({} growth points)",
                       core::to_string(mode), value, growth.size());
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

CalculationResult Engine::calculate(const CalculationRequest& request) const {
    auto result = std::visit(Dispatch{config_.include_growth}, request);

    if (config_.verbose) {
        fmt::print(stderr, "[irrkit] {} -> value={:.10g} points={}\n",
                   core::to_string(result.mode), result.value,
                   result.growth.size());
    }
    return result;
}

std::optional<CalculationResult>
Engine::try_calculate(const CalculationRequest& request) const {
    const auto issues = validation::validate(request);
    if (!issues.empty()) {
        if (config_.verbose) {
            for (const auto& issue : issues) {
                fmt::print(stderr, "[irrkit] rejected {}: {}\n",
                           issue.field, issue.message);
            }
        }
        return std::nullopt;
    }
    return calculate(request);
}

} // namespace irrkit::core
