/// @file src/core/types.cpp
/// @brief Display names for the follow-on classification enums.

#include "irrkit/types.hpp"

namespace irrkit {

std::string_view to_string(InvestmentType type) noexcept {
    switch (type) {
        case InvestmentType::Buy:     return "Buy";
        case InvestmentType::Sell:    return "Sell";
        case InvestmentType::BuySell: return "Buy/Sell";
    }
    return "Unknown";
}

std::string_view to_string(ValuationMode mode) noexcept {
    switch (mode) {
        case ValuationMode::TagAlong: return "Tag-Along";
        case ValuationMode::Custom:   return "Custom";
    }
    return "Unknown";
}

std::string_view to_string(ValuationType type) noexcept {
    switch (type) {
        case ValuationType::Computed:  return "Computed";
        case ValuationType::Specified: return "Specified";
    }
    return "Unknown";
}

std::string_view to_string(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::Days:   return "Days";
        case TimeUnit::Months: return "Months";
        case TimeUnit::Years:  return "Years";
    }
    return "Unknown";
}

} // namespace irrkit
