/// @file src/core/calendar.cpp
/// @brief Civil-date arithmetic for follow-on timing resolution.

#include "irrkit/calendar.hpp"
#include "irrkit/constants.hpp"

#include <algorithm>

namespace irrkit::calendar {

namespace chr = std::chrono;

Date make_date(int year, unsigned month, unsigned day) noexcept {
    return Date{chr::year{year}, chr::month{month}, chr::day{day}};
}

Date add_days(Date date, long long days) noexcept {
    return Date{chr::sys_days{date} + chr::days{days}};
}

Date add_months(Date date, long long months) noexcept {
    const chr::year_month ym =
        chr::year_month{date.year(), date.month()} + chr::months{months};
    // Clamp: Jan 31 + 1 month → Feb 28/29.
    const chr::day last = chr::year_month_day_last{ym.year(),
        chr::month_day_last{ym.month()}}.day();
    return Date{ym.year(), ym.month(), std::min(date.day(), last)};
}

long long days_between(Date from, Date to) noexcept {
    return (chr::sys_days{to} - chr::sys_days{from}).count();
}

double years_between(Date from, Date to) noexcept {
    return static_cast<double>(days_between(from, to)) / constants::DAYS_PER_YEAR;
}

int months_until(Date from, Date to) noexcept {
    if (to <= from) return 0;

    // First guess from the calendar fields, then settle on the boundary.
    int m = (static_cast<int>(to.year()) - static_cast<int>(from.year())) * 12
          + (static_cast<int>(static_cast<unsigned>(to.month()))
             - static_cast<int>(static_cast<unsigned>(from.month())));
    m = std::max(m, 0);

    while (add_months(from, m) < to) ++m;
    while (m > 0 && add_months(from, m - 1) >= to) --m;
    return m;
}

} // namespace irrkit::calendar
