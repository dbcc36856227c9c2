/// @file src/core/request.cpp
/// @brief Calculation mode helpers.

#include "irrkit/request.hpp"

namespace irrkit::core {

// Alternative order in CalculationRequest matches CalculationMode.
static_assert(std::variant_size_v<CalculationRequest> == 6);

CalculationMode mode_of(const CalculationRequest& request) noexcept {
    return static_cast<CalculationMode>(request.index());
}

std::string_view to_string(CalculationMode mode) noexcept {
    switch (mode) {
        case CalculationMode::Irr:                  return "Calculate IRR";
        case CalculationMode::Outcome:              return "Calculate Outcome";
        case CalculationMode::InitialInvestment:    return "Calculate Initial Investment";
        case CalculationMode::BlendedIrr:           return "Calculate Blended IRR";
        case CalculationMode::PortfolioUnit:        return "Portfolio Unit Investment";
        case CalculationMode::PortfolioUnitBlended: return "Portfolio Unit Investment (Blended)";
    }
    return "Unknown";
}

bool yields_rate(CalculationMode mode) noexcept {
    return mode != CalculationMode::Outcome
        && mode != CalculationMode::InitialInvestment;
}

portfolio::UnitTerms terms_of(const PortfolioUnitRequest& r) noexcept {
    return portfolio::UnitTerms{
        .success_rate     = r.success_rate,
        .outcome_per_unit = r.outcome_per_unit,
        .investor_share   = r.investor_share,
        .fee_percentage   = r.fee_percentage,
    };
}

portfolio::UnitTerms terms_of(const PortfolioUnitBlendedRequest& r) noexcept {
    return portfolio::UnitTerms{
        .success_rate     = r.success_rate,
        .outcome_per_unit = r.outcome_per_unit,
        .investor_share   = r.investor_share,
        .fee_percentage   = r.fee_percentage,
    };
}

} // namespace irrkit::core
