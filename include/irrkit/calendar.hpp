#pragma once

/// @file include/irrkit/calendar.hpp
/// @brief Civil-date arithmetic used to resolve follow-on timing.
///
/// All functions are pure and operate on `irrkit::Date`. Month arithmetic
/// clamps the day to the end of the target month, so Jan 31 + 1 month is
/// the last day of February.

#include "irrkit/types.hpp"

namespace irrkit::calendar {

/// Construct a date from year/month/day numbers.
///
/// # Returns
/// The date. `date.ok()` is false for impossible combinations (Feb 30).
[[nodiscard]] Date make_date(int year, unsigned month, unsigned day) noexcept;

/// `date + days`. `days` may be negative.
[[nodiscard]] Date add_days(Date date, long long days) noexcept;

/// `date + months` calendar months, day clamped to the month's last day.
[[nodiscard]] Date add_months(Date date, long long months) noexcept;

/// Signed number of days from `from` to `to`.
[[nodiscard]] long long days_between(Date from, Date to) noexcept;

/// Fractional years from `from` to `to`, using DAYS_PER_YEAR.
[[nodiscard]] double years_between(Date from, Date to) noexcept;

/// Smallest whole month count `m ≥ 0` such that `from + m months ≥ to`.
///
/// Returns 0 when `to` is on or before `from`.
[[nodiscard]] int months_until(Date from, Date to) noexcept;

} // namespace irrkit::calendar
