/**
 * @file  prop_portfolio_bounds.cpp
 * @brief Property: portfolio unit rates respond to their terms in the
 *        expected direction and ignore batch dates.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_portfolio_bounds
 *
 * Properties:
 *   1. One batch, no follow-ons  → blended_unit_irr == unit_irr
 *   2. Higher fee                → rate does not increase
 *   3. Moving a batch in time    → rate unchanged
 *   4. Percentage outside range  → rate is exactly 0
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "irrkit/calendar.hpp"
#include "irrkit/portfolio.hpp"

using namespace irrkit;
using namespace irrkit::portfolio;

namespace {

const Date kBase = calendar::make_date(2022, 1, 1);

/// Terms with every payout component strictly positive.
UnitTerms gen_paying_terms() {
    return UnitTerms{
        .success_rate     = *rc::gen::inRange(1, 101) * 1.0,
        .outcome_per_unit = *rc::gen::inRange(1, 100'000) / 10.0,
        .investor_share   = *rc::gen::inRange(1, 101) * 1.0,
        .fee_percentage   = *rc::gen::inRange(0, 99) * 1.0,
    };
}

PortfolioUnitBatch gen_batch(Date date) {
    return PortfolioUnitBatch{
        *rc::gen::inRange(100, 10'000'000) / 100.0,
        *rc::gen::inRange(1, 100'000) / 100.0,
        date,
    };
}

double gen_years() { return *rc::gen::inRange(1, 30 * 12) / 12.0; }

} // namespace

int main() {
    bool ok = true;

    ok &= rc::check(
        "portfolio_bounds: single batch blended equals unit_irr",
        []() {
            const auto terms = gen_paying_terms();
            const auto batch = gen_batch(kBase);
            const double t   = gen_years();
            RC_ASSERT(blended_unit_irr(batch, {}, terms, t)
                      == unit_irr(batch.investment_amount, batch.unit_price, terms, t));
        }
    );

    ok &= rc::check(
        "portfolio_bounds: higher fee never raises the rate",
        []() {
            auto low  = gen_paying_terms();
            auto high = low;
            high.fee_percentage = *rc::gen::inRange(static_cast<int>(low.fee_percentage), 100);
            const auto batch = gen_batch(kBase);
            const double t   = gen_years();
            RC_ASSERT(unit_irr(batch.investment_amount, batch.unit_price, high, t)
                      <= unit_irr(batch.investment_amount, batch.unit_price, low, t));
        }
    );

    ok &= rc::check(
        "portfolio_bounds: batch dates do not affect the rate",
        []() {
            const auto terms   = gen_paying_terms();
            const auto initial = gen_batch(kBase);
            const auto early   = gen_batch(calendar::add_days(kBase, *rc::gen::inRange(0, 400)));
            auto late          = early;
            late.investment_date = calendar::add_days(kBase, *rc::gen::inRange(400, 4000));
            const double t = gen_years();

            const std::vector<PortfolioUnitBatch> a = {early};
            const std::vector<PortfolioUnitBatch> b = {late};
            RC_ASSERT(blended_unit_irr(initial, a, terms, t)
                      == blended_unit_irr(initial, b, terms, t));
        }
    );

    ok &= rc::check(
        "portfolio_bounds: out-of-range percentage yields 0",
        []() {
            auto terms = gen_paying_terms();
            terms.success_rate = 100.0 + *rc::gen::inRange(1, 1000) / 10.0;
            const auto batch = gen_batch(kBase);
            RC_ASSERT(unit_irr(batch.investment_amount, batch.unit_price,
                               terms, gen_years()) == 0.0);
        }
    );

    return ok ? 0 : 1;
}
