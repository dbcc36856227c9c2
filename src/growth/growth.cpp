/// @file src/growth/growth.cpp
/// @brief Growth Projection Engine implementation.

#include "irrkit/growth.hpp"
#include "irrkit/blended.hpp"
#include "irrkit/calendar.hpp"
#include "irrkit/constants.hpp"
#include "irrkit/rates.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace irrkit::growth {

namespace {

/// One precomputed overlay term.
struct Overlay {
    int    start_month; ///< First month on or after the event date
    double elapsed;     ///< Years from the base date to the event
    double sign;        ///< +1 adds value, −1 removes it
    double amount;
    double rate;
};

/// (1 + rate)^(months / 12)
[[nodiscard]] double monthly_factor(double rate, int months) noexcept {
    return rates::growth_factor(rate,
        static_cast<double>(months) / constants::MONTHS_PER_YEAR);
}

/// Sum the base trajectory and every started overlay at each month.
[[nodiscard]] GrowthSeries
project(double initial, double rate, int months,
        const std::vector<Overlay>& overlays) {
    GrowthSeries series;
    series.reserve(static_cast<std::size_t>(months) + 1);

    for (int m = 0; m <= months; ++m) {
        double value = initial * monthly_factor(rate, m);
        const double t = static_cast<double>(m) / constants::MONTHS_PER_YEAR;
        for (const auto& o : overlays) {
            if (o.start_month > m) continue;
            // Growth runs from the event date itself, not the month boundary.
            const double since = t - o.elapsed;
            if (since < 0.0) continue;
            value += o.sign * o.amount * rates::growth_factor(o.rate, since);
        }
        series.push_back(GrowthPoint{m, value});
    }
    return series;
}

} // namespace

// ─── Plain trajectories ───────────────────────────────────────────────────────

int total_months(double years) noexcept {
    if (!std::isfinite(years) || years <= 0.0) return 0;

    const double months = std::floor(years * constants::MONTHS_PER_YEAR);
    if (months >= static_cast<double>(constants::MAX_PROJECTION_MONTHS)) {
        return constants::MAX_PROJECTION_MONTHS;
    }
    return static_cast<int>(months);
}

GrowthSeries growth_points(double initial, double rate, double years) {
    return project(initial, rate, total_months(years), {});
}

// ─── Follow-on overlays ───────────────────────────────────────────────────────

double event_rate(const FollowOnInvestment& follow_on, double initial,
                  double rate, double years, double elapsed) noexcept {
    if (follow_on.valuation_mode() == ValuationMode::TagAlong) return rate;

    if (follow_on.is_custom_computed()) {
        return follow_on.custom_irr() > -1.0 ? follow_on.custom_irr() : rate;
    }

    // Custom/Specified: the rate that carries the stated valuation to the
    // base investment's terminal value over the remaining time.
    const double remaining = years - elapsed;
    if (follow_on.valuation() <= 0.0 || remaining <= 0.0) return rate;

    const double final_value = initial * rates::growth_factor(rate, years);
    const double custom = std::pow(final_value / follow_on.valuation(),
                                   1.0 / remaining) - 1.0;
    return std::isfinite(custom) ? custom : rate;
}

GrowthSeries
growth_points_with_follow_ons(double initial, double rate, double years,
                              std::span<const FollowOnInvestment> follow_ons,
                              Date initial_date) {
    const int months = total_months(years);

    std::vector<Overlay> overlays;
    overlays.reserve(follow_ons.size());
    for (const auto& event : blended::sort_by_date(follow_ons)) {
        const double elapsed = blended::elapsed_years(initial_date, event);
        if (elapsed < 0.0) continue;

        const double sign =
            event.investment_type() == InvestmentType::Sell ? -1.0 : 1.0;
        overlays.push_back(Overlay{
            .start_month = calendar::months_until(initial_date, event.date()),
            .elapsed     = elapsed,
            .sign        = sign,
            .amount      = event.amount(),
            .rate        = event_rate(event, initial, rate, years, elapsed),
        });
    }

    return project(initial, rate, months, overlays);
}

// ─── Portfolio trajectories ───────────────────────────────────────────────────

GrowthSeries
portfolio_unit_growth_points(double investment_amount, double unit_price,
                             const portfolio::UnitTerms& terms, double years) {
    const double rate = portfolio::unit_irr(investment_amount, unit_price,
                                            terms, years);
    return growth_points(investment_amount, rate, years);
}

GrowthSeries
portfolio_blended_growth_points(const PortfolioUnitBatch& initial_batch,
                                std::span<const PortfolioUnitBatch> follow_on_batches,
                                const portfolio::UnitTerms& terms, double years,
                                Date initial_date) {
    const double rate = portfolio::blended_unit_irr(initial_batch,
                                                    follow_on_batches,
                                                    terms, years);

    std::vector<PortfolioUnitBatch> batches(follow_on_batches.begin(),
                                            follow_on_batches.end());
    std::stable_sort(batches.begin(), batches.end(),
        [](const PortfolioUnitBatch& a, const PortfolioUnitBatch& b) {
            return a.investment_date < b.investment_date;
        });

    std::vector<Overlay> overlays;
    overlays.reserve(batches.size());
    for (const auto& batch : batches) {
        if (!batch.valid()) continue;
        const double elapsed =
            calendar::years_between(initial_date, batch.investment_date);
        if (elapsed < 0.0) continue;
        overlays.push_back(Overlay{
            .start_month = calendar::months_until(initial_date, batch.investment_date),
            .elapsed     = elapsed,
            .sign        = 1.0,
            .amount      = batch.investment_amount,
            .rate        = rate,
        });
    }

    return project(initial_batch.investment_amount, rate,
                   total_months(years), overlays);
}

} // namespace irrkit::growth
