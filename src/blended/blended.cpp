/// @file src/blended/blended.cpp
/// @brief Blended IRR Engine implementation.

#include "irrkit/blended.hpp"
#include "irrkit/calendar.hpp"
#include "irrkit/rates.hpp"

#include <algorithm>
#include <cmath>

namespace irrkit::blended {

namespace {

/// outcome / (initial × (1 + base_rate)^t), or nullopt when degenerate.
[[nodiscard]] std::optional<double>
tag_along_ratio(double initial, double outcome, double base_rate,
                double elapsed) noexcept {
    const double current_value = initial * rates::growth_factor(base_rate, elapsed);
    if (!std::isfinite(current_value) || current_value <= 0.0) return std::nullopt;

    const double ratio = outcome / current_value;
    if (!std::isfinite(ratio)) return std::nullopt;
    return ratio;
}

} // namespace

// ─── Ordering / timing ────────────────────────────────────────────────────────

std::vector<FollowOnInvestment>
sort_by_date(std::span<const FollowOnInvestment> follow_ons) {
    std::vector<FollowOnInvestment> sorted(follow_ons.begin(), follow_ons.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const FollowOnInvestment& a, const FollowOnInvestment& b) {
            return a.date() < b.date();
        });
    return sorted;
}

double elapsed_years(Date initial_date,
                     const FollowOnInvestment& follow_on) noexcept {
    return calendar::years_between(initial_date, follow_on.date());
}

// ─── Proceeds ─────────────────────────────────────────────────────────────────

double event_proceeds(const FollowOnInvestment& follow_on,
                      double initial, double outcome, double years,
                      double base_rate, double elapsed) noexcept {
    if (follow_on.investment_type() == InvestmentType::Buy) return 0.0;

    const auto ratio = tag_along_ratio(initial, outcome, base_rate, elapsed);
    const double tag_along = ratio ? follow_on.amount() * *ratio : 0.0;

    if (follow_on.investment_type() == InvestmentType::BuySell) return tag_along;
    if (follow_on.valuation_mode() == ValuationMode::TagAlong)  return tag_along;
    if (follow_on.is_custom_specified())                       return follow_on.amount();

    // Custom/Computed: value the stake at the event from its own rate, then
    // carry it to exit on the base investment's outcome/current-value ratio.
    const double rate      = follow_on.custom_irr();
    const double remaining = years - elapsed;
    if (!ratio || rate <= -1.0 || remaining <= 0.0) return tag_along;

    const double valuation = follow_on.amount() * rates::growth_factor(rate, elapsed);
    const double proceeds  = valuation * *ratio;
    if (!std::isfinite(proceeds)) return tag_along;
    return proceeds;
}

// ─── Blended IRR ──────────────────────────────────────────────────────────────

std::optional<BlendedBreakdown>
blended_breakdown(double initial, double outcome, double years,
                  std::span<const FollowOnInvestment> follow_ons,
                  Date initial_date) {
    if (!std::isfinite(initial) || !std::isfinite(outcome) || !std::isfinite(years)) {
        return std::nullopt;
    }
    if (initial <= 0.0 || outcome <= 0.0 || years <= 0.0) return std::nullopt;
    if (!initial_date.ok()) return std::nullopt;

    const double base_rate = rates::irr(initial, outcome, years);

    BlendedBreakdown out{
        .base_rate      = base_rate,
        .total_invested = initial,
        .total_proceeds = 0.0,
        .final_outcome  = outcome,
        .rate           = base_rate,
    };
    if (follow_ons.empty()) return out;

    // Processing order is part of the result: summation follows the dates.
    for (const auto& event : sort_by_date(follow_ons)) {
        const double elapsed = elapsed_years(initial_date, event);
        if (elapsed < 0.0) return std::nullopt;

        switch (event.investment_type()) {
            case InvestmentType::Buy:
                out.total_invested += event.amount();
                break;
            case InvestmentType::Sell:
                out.total_proceeds += event_proceeds(event, initial, outcome,
                                                     years, base_rate, elapsed);
                break;
            case InvestmentType::BuySell:
                out.total_invested += event.amount();
                out.total_proceeds += event_proceeds(event, initial, outcome,
                                                     years, base_rate, elapsed);
                break;
        }
    }

    out.final_outcome = outcome + out.total_proceeds;
    out.rate          = rates::irr(out.total_invested, out.final_outcome, years);
    return out;
}

double blended_irr(double initial, double outcome, double years,
                   std::span<const FollowOnInvestment> follow_ons,
                   Date initial_date) {
    if (follow_ons.empty()) return rates::irr(initial, outcome, years);

    const auto breakdown = blended_breakdown(initial, outcome, years,
                                             follow_ons, initial_date);
    return breakdown ? breakdown->rate : 0.0;
}

} // namespace irrkit::blended
