#pragma once

/// @file include/irrkit/types.hpp
/// @brief Shared value types for the IRRKit calculation engine.
///
/// Every module includes this file. It defines the calendar date alias,
/// the follow-on classification enums and the growth-series sample type.
/// All types here are trivially copyable values; nothing owns resources.

#include <chrono>
#include <string_view>
#include <vector>

namespace irrkit {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// A civil calendar date. Investment timing never carries a time of day.
using Date = std::chrono::year_month_day;

// ─── Follow-On Classification ─────────────────────────────────────────────────

/// Direction of a follow-on cash-flow event.
enum class InvestmentType {
    Buy,     ///< Adds capital
    Sell,    ///< Realises proceeds from part of the position
    BuySell, ///< Adds capital and realises pro-rata proceeds
};

/// How a follow-on event is valued.
enum class ValuationMode {
    TagAlong, ///< Grows at the base investment's rate
    Custom,   ///< Follows an independently specified trajectory
};

/// Source of a custom valuation. Ignored for TagAlong events.
enum class ValuationType {
    Computed,  ///< Derived from a supplied rate and elapsed time
    Specified, ///< Given literally
};

/// Unit of a relative follow-on offset.
enum class TimeUnit {
    Days,
    Months,
    Years,
};

[[nodiscard]] std::string_view to_string(InvestmentType type) noexcept;
[[nodiscard]] std::string_view to_string(ValuationMode mode) noexcept;
[[nodiscard]] std::string_view to_string(ValuationType type) noexcept;
[[nodiscard]] std::string_view to_string(TimeUnit unit) noexcept;

// ─── Growth Series ────────────────────────────────────────────────────────────

/// One monthly sample of a portfolio value trajectory.
struct GrowthPoint {
    int    month; ///< Months since the base investment (≥ 0)
    double value; ///< Portfolio value at that month

    friend bool operator==(const GrowthPoint&, const GrowthPoint&) = default;
};

/// A fully materialised trajectory, month 0 through the final month.
using GrowthSeries = std::vector<GrowthPoint>;

} // namespace irrkit
