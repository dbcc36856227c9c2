/// @file src/rates/rates.cpp
/// @brief Core Rate Engine implementation.
///
/// Every fallible path returns 0.0; no function calls abort(), assert(), or
/// throws.

#include "irrkit/rates.hpp"

#include <cmath>

namespace irrkit::rates {

namespace {

/// Map NaN / ±Inf results to the 0.0 sentinel.
[[nodiscard]] double finite_or_zero(double x) noexcept {
    return std::isfinite(x) ? x : 0.0;
}

} // namespace

double growth_factor(double rate, double years) noexcept {
    return std::pow(1.0 + rate, years);
}

double irr(double initial, double outcome, double years) noexcept {
    if (!std::isfinite(initial) || !std::isfinite(outcome) || !std::isfinite(years)) {
        return 0.0;
    }
    if (initial <= 0.0 || outcome <= 0.0 || years <= 0.0) return 0.0;

    return finite_or_zero(std::pow(outcome / initial, 1.0 / years) - 1.0);
}

double future_value(double initial, double rate, double years) noexcept {
    if (!std::isfinite(initial) || !std::isfinite(rate) || !std::isfinite(years)) {
        return 0.0;
    }
    if (initial <= 0.0 || years < 0.0) return 0.0;

    return finite_or_zero(initial * growth_factor(rate, years));
}

double present_value(double outcome, double rate, double years) noexcept {
    if (!std::isfinite(outcome) || !std::isfinite(rate) || !std::isfinite(years)) {
        return 0.0;
    }
    if (outcome <= 0.0 || years < 0.0) return 0.0;

    const double divisor = growth_factor(rate, years);
    if (divisor == 0.0) return 0.0;  // rate = −1 with years > 0

    return finite_or_zero(outcome / divisor);
}

} // namespace irrkit::rates
