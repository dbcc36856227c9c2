/**
 * @file  prop_growth_shape.cpp
 * @brief Property: growth series have one point per whole month, start at the
 *        initial amount and follow (1 + r)^(m/12).
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_growth_shape
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "irrkit/calendar.hpp"
#include "irrkit/growth.hpp"

using namespace irrkit;

int main() {
    bool ok = true;

    // ── Property 1: shape ────────────────────────────────────────────────────
    ok &= rc::check(
        "growth_shape: months 0..floor(12 t), first point is the initial amount",
        []() {
            const double initial = *rc::gen::inRange(1, 1'000'000) / 1.0;
            const double rate    = *rc::gen::inRange(-90, 300) / 100.0;
            const double years   = *rc::gen::inRange(1, 50 * 12) / 12.0 + 0.01;

            const auto series = growth::growth_points(initial, rate, years);
            RC_ASSERT(static_cast<int>(series.size())
                      == growth::total_months(years) + 1);
            for (std::size_t m = 0; m < series.size(); ++m) {
                RC_ASSERT(series[m].month == static_cast<int>(m));
                RC_ASSERT(std::isfinite(series[m].value));
            }
            RC_ASSERT(series.front().value == initial);
        }
    );

    // ── Property 2: monotone in the sign of the rate ─────────────────────────
    ok &= rc::check(
        "growth_shape: positive rate never decreases, negative never increases",
        []() {
            const double initial = *rc::gen::inRange(1, 1'000'000) / 1.0;
            const double rate    = *rc::gen::inRange(-90, 300) / 100.0;
            const double years   = *rc::gen::inRange(1, 30);

            const auto series = growth::growth_points(initial, rate, years);
            for (std::size_t m = 1; m < series.size(); ++m) {
                if (rate > 0.0) RC_ASSERT(series[m].value >= series[m - 1].value);
                if (rate < 0.0) RC_ASSERT(series[m].value <= series[m - 1].value);
            }
        }
    );

    // ── Property 3: no follow-ons → plain projection ─────────────────────────
    ok &= rc::check(
        "growth_shape: empty follow-on list matches growth_points",
        []() {
            const double initial = *rc::gen::inRange(1, 1'000'000) / 1.0;
            const double rate    = *rc::gen::inRange(-90, 300) / 100.0;
            const double years   = *rc::gen::inRange(1, 20);

            const std::vector<FollowOnInvestment> none;
            RC_ASSERT(growth::growth_points_with_follow_ons(
                          initial, rate, years, none, calendar::make_date(2021, 6, 30))
                      == growth::growth_points(initial, rate, years));
        }
    );

    return ok ? 0 : 1;
}
