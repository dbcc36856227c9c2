/// @file src/core/follow_on.cpp
/// @brief FollowOnInvestment construction and timing resolution.

#include "irrkit/follow_on.hpp"
#include "irrkit/calendar.hpp"
#include "irrkit/constants.hpp"

#include <cmath>

namespace irrkit {

namespace {

/// Upper bound on a relative amount, expressed in its own unit.
[[nodiscard]] double max_offset(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::Days:   return constants::MAX_OFFSET_YEARS * constants::DAYS_PER_YEAR;
        case TimeUnit::Months: return constants::MAX_OFFSET_YEARS * constants::MONTHS_PER_YEAR;
        case TimeUnit::Years:  return constants::MAX_OFFSET_YEARS;
    }
    return 0.0;
}

} // namespace

// ─── resolve_timing ───────────────────────────────────────────────────────────

std::optional<Date>
resolve_timing(const Timing& timing, Date base_date) noexcept {
    if (const auto* abs = std::get_if<AbsoluteTiming>(&timing)) {
        if (!abs->date.ok()) return std::nullopt;
        return abs->date;
    }

    const auto& rel = std::get<RelativeTiming>(timing);
    if (!base_date.ok())             return std::nullopt;
    if (!std::isfinite(rel.amount))  return std::nullopt;
    if (rel.amount < 0.0)            return std::nullopt;
    if (rel.amount > max_offset(rel.unit)) return std::nullopt;

    Date resolved{};
    switch (rel.unit) {
        case TimeUnit::Days:
            resolved = calendar::add_days(base_date,
                                          static_cast<long long>(rel.amount));
            break;
        case TimeUnit::Months:
            resolved = calendar::add_months(base_date,
                                            static_cast<long long>(rel.amount));
            break;
        case TimeUnit::Years:
            resolved = calendar::add_days(base_date,
                static_cast<long long>(rel.amount * constants::DAYS_PER_YEAR));
            break;
    }
    if (!resolved.ok()) return std::nullopt;
    return resolved;
}

// ─── FollowOnInvestment ───────────────────────────────────────────────────────

FollowOnInvestment::FollowOnInvestment(const FollowOnSpec& spec,
                                       Date resolved) noexcept
    : timing_(spec.timing)
    , date_(resolved)
    , investment_type_(spec.investment_type)
    , amount_(spec.amount)
    , valuation_mode_(spec.valuation_mode)
    , valuation_type_(spec.valuation_type)
    , valuation_(spec.valuation)
    , custom_irr_(spec.custom_irr)
{}

std::optional<FollowOnInvestment>
FollowOnInvestment::make(const FollowOnSpec& spec, Date base_date) noexcept {
    if (!std::isfinite(spec.amount) || spec.amount <= 0.0) return std::nullopt;
    if (!std::isfinite(spec.valuation))                    return std::nullopt;
    if (!std::isfinite(spec.custom_irr))                   return std::nullopt;

    const auto resolved = resolve_timing(spec.timing, base_date);
    if (!resolved) return std::nullopt;

    return FollowOnInvestment(spec, *resolved);
}

// ─── PortfolioUnitBatch ───────────────────────────────────────────────────────

bool PortfolioUnitBatch::valid() const noexcept {
    return std::isfinite(investment_amount) && investment_amount > 0.0
        && std::isfinite(unit_price)        && unit_price > 0.0;
}

std::optional<PortfolioUnitBatch>
PortfolioUnitBatch::make(double investment_amount, double unit_price,
                         Date investment_date) noexcept {
    PortfolioUnitBatch batch{investment_amount, unit_price, investment_date};
    if (!batch.valid())          return std::nullopt;
    if (!investment_date.ok())   return std::nullopt;
    return batch;
}

} // namespace irrkit
