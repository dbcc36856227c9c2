/// @file src/validation/validation.cpp
/// @brief Strict request validation.

#include "irrkit/validation.hpp"
#include "irrkit/constants.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <string_view>
#include <utility>

namespace irrkit::validation {

// ─── Predicates ───────────────────────────────────────────────────────────────

bool is_positive(double x) noexcept {
    return std::isfinite(x) && x > 0.0;
}

bool is_percentage(double x) noexcept {
    return std::isfinite(x)
        && x >= constants::MIN_PERCENTAGE
        && x <= constants::MAX_PERCENTAGE;
}

bool is_rate(double x) noexcept {
    return std::isfinite(x)
        && x > constants::MIN_RATE
        && x < constants::MAX_RATE;
}

namespace {

// ─── Rule helpers ─────────────────────────────────────────────────────────────

using Issues = std::vector<ValidationIssue>;

void require_positive(Issues& out, std::string field, double value,
                      std::string_view label) {
    if (is_positive(value)) return;
    out.push_back({std::move(field),
                   fmt::format("{} must be a positive number", label)});
}

void require_percentage(Issues& out, std::string field, double value,
                        std::string_view label) {
    if (is_percentage(value)) return;
    out.push_back({std::move(field),
                   fmt::format("{} must be between 0% and 100%", label)});
}

void require_rate(Issues& out, std::string field, double value) {
    if (is_rate(value)) return;
    out.push_back({std::move(field),
                   "IRR must be greater than -100% and less than 1000%"});
}

void require_date(Issues& out, std::string field, Date date) {
    if (date.ok()) return;
    out.push_back({std::move(field), "Date is not a valid calendar date"});
}

void check_follow_on(Issues& out, std::size_t i,
                     const FollowOnInvestment& event, Date initial_date) {
    const std::string prefix = fmt::format("follow_ons[{}]", i);

    if (initial_date.ok() && event.date() < initial_date) {
        out.push_back({prefix + ".date",
                       "Follow-on date must not precede the initial investment"});
    }
    if (event.is_custom_specified()) {
        require_positive(out, prefix + ".valuation", event.valuation(), "Valuation");
    }
    if (event.is_custom_computed()) {
        require_rate(out, prefix + ".custom_irr", event.custom_irr());
    }
}

void check_batch(Issues& out, const std::string& prefix,
                 const PortfolioUnitBatch& batch) {
    require_positive(out, prefix + ".investment_amount",
                     batch.investment_amount, "Investment amount");
    require_positive(out, prefix + ".unit_price", batch.unit_price, "Unit price");
}

// ─── Per-mode rules ───────────────────────────────────────────────────────────

void check(Issues& out, const core::IrrRequest& r) {
    require_positive(out, "initial", r.initial, "Initial investment");
    require_positive(out, "outcome", r.outcome, "Outcome");
    require_positive(out, "years",   r.years,   "Time in years");
}

void check(Issues& out, const core::OutcomeRequest& r) {
    require_positive(out, "initial", r.initial, "Initial investment");
    require_rate(out, "irr", r.irr);
    require_positive(out, "years", r.years, "Time in years");
}

void check(Issues& out, const core::InitialInvestmentRequest& r) {
    require_positive(out, "outcome", r.outcome, "Outcome");
    require_rate(out, "irr", r.irr);
    require_positive(out, "years", r.years, "Time in years");
}

void check(Issues& out, const core::BlendedIrrRequest& r) {
    require_positive(out, "initial", r.initial, "Initial investment");
    require_positive(out, "outcome", r.outcome, "Outcome");
    require_positive(out, "years",   r.years,   "Time in years");
    require_date(out, "initial_date", r.initial_date);
    for (std::size_t i = 0; i < r.follow_ons.size(); ++i) {
        check_follow_on(out, i, r.follow_ons[i], r.initial_date);
    }
}

void check(Issues& out, const core::PortfolioUnitRequest& r) {
    require_positive(out, "investment_amount", r.investment_amount, "Investment amount");
    require_positive(out, "unit_price", r.unit_price, "Unit price");
    require_percentage(out, "success_rate", r.success_rate, "Success rate");
    require_positive(out, "outcome_per_unit", r.outcome_per_unit, "Outcome per unit");
    require_percentage(out, "investor_share", r.investor_share, "Investor share");
    require_positive(out, "years", r.years, "Time in years");
    require_percentage(out, "fee_percentage", r.fee_percentage, "Fee percentage");
}

void check(Issues& out, const core::PortfolioUnitBlendedRequest& r) {
    check_batch(out, "initial_batch", r.initial_batch);
    require_positive(out, "years", r.years, "Time in years");
    require_percentage(out, "success_rate", r.success_rate, "Success rate");
    require_positive(out, "outcome_per_unit", r.outcome_per_unit, "Outcome per unit");
    require_percentage(out, "investor_share", r.investor_share, "Investor share");
    require_percentage(out, "fee_percentage", r.fee_percentage, "Fee percentage");
    require_date(out, "initial_date", r.initial_date);
    for (std::size_t i = 0; i < r.follow_on_batches.size(); ++i) {
        const auto& batch = r.follow_on_batches[i];
        const std::string prefix = fmt::format("follow_on_batches[{}]", i);
        check_batch(out, prefix, batch);

        if (!batch.investment_date.ok()) {
            require_date(out, prefix + ".investment_date", batch.investment_date);
        } else if (r.initial_date.ok() && batch.investment_date < r.initial_date) {
            out.push_back({prefix + ".investment_date",
                           "Follow-on date must not precede the initial investment"});
        }
    }
}

} // namespace

// ─── Public API ───────────────────────────────────────────────────────────────

std::vector<ValidationIssue> validate(const core::CalculationRequest& request) {
    Issues issues;
    std::visit([&issues](const auto& r) { check(issues, r); }, request);
    return issues;
}

bool is_valid(const core::CalculationRequest& request) {
    return validate(request).empty();
}

} // namespace irrkit::validation
