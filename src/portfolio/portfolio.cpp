/// @file src/portfolio/portfolio.cpp
/// @brief Portfolio Unit Engine implementation.

#include "irrkit/portfolio.hpp"
#include "irrkit/constants.hpp"
#include "irrkit/rates.hpp"

#include <cmath>

namespace irrkit::portfolio {

namespace {

[[nodiscard]] bool is_percentage(double x) noexcept {
    return std::isfinite(x)
        && x >= constants::MIN_PERCENTAGE
        && x <= constants::MAX_PERCENTAGE;
}

} // namespace

bool terms_valid(const UnitTerms& terms) noexcept {
    return is_percentage(terms.success_rate)
        && is_percentage(terms.investor_share)
        && is_percentage(terms.fee_percentage)
        && std::isfinite(terms.outcome_per_unit);
}

double net_outcome_per_unit(const UnitTerms& terms) noexcept {
    const double gross = terms.outcome_per_unit
                       * (terms.investor_share / constants::PERCENT_SCALE);
    return gross * (1.0 - terms.fee_percentage / constants::PERCENT_SCALE);
}

double total_outcome(double units, const UnitTerms& terms) noexcept {
    if (!std::isfinite(units) || units <= 0.0) return 0.0;
    if (!terms_valid(terms))                   return 0.0;

    const double successful = units * (terms.success_rate / constants::PERCENT_SCALE);
    return successful * net_outcome_per_unit(terms);
}

double unit_irr(double investment_amount, double unit_price,
                const UnitTerms& terms, double years) noexcept {
    const auto batch = PortfolioUnitBatch{investment_amount, unit_price, Date{}};
    if (!batch.valid())                          return 0.0;
    if (!std::isfinite(years) || years <= 0.0)   return 0.0;
    if (!terms_valid(terms))                     return 0.0;

    return rates::irr(investment_amount, total_outcome(batch.units(), terms), years);
}

std::optional<PooledUnits>
pool_batches(const PortfolioUnitBatch& initial_batch,
             std::span<const PortfolioUnitBatch> follow_on_batches) noexcept {
    if (!initial_batch.valid()) return std::nullopt;

    PooledUnits pooled{initial_batch.investment_amount, initial_batch.units()};
    for (const auto& batch : follow_on_batches) {
        if (!batch.valid()) return std::nullopt;
        pooled.total_investment += batch.investment_amount;
        pooled.total_units      += batch.units();
    }
    return pooled;
}

double blended_unit_irr(const PortfolioUnitBatch& initial_batch,
                        std::span<const PortfolioUnitBatch> follow_on_batches,
                        const UnitTerms& terms, double years) noexcept {
    if (!std::isfinite(years) || years <= 0.0) return 0.0;
    if (!terms_valid(terms))                   return 0.0;

    const auto pooled = pool_batches(initial_batch, follow_on_batches);
    if (!pooled) return 0.0;

    return rates::irr(pooled->total_investment,
                      total_outcome(pooled->total_units, terms), years);
}

} // namespace irrkit::portfolio
