#include <gtest/gtest.h>
#include "irrkit/calendar.hpp"
#include "irrkit/validation.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace irrkit;
using namespace irrkit::core;
using namespace irrkit::validation;
using irrkit::calendar::make_date;

namespace {

const Date kBase = make_date(2024, 1, 1);

bool has_field(const std::vector<ValidationIssue>& issues, const std::string& field) {
    return std::any_of(issues.begin(), issues.end(),
                       [&](const ValidationIssue& i) { return i.field == field; });
}

const ValidationIssue* find_field(const std::vector<ValidationIssue>& issues,
                                  const std::string& field) {
    for (const auto& i : issues) {
        if (i.field == field) return &i;
    }
    return nullptr;
}

} // namespace

// ─── Predicates ───────────────────────────────────────────────────────────────

TEST(Validation_Predicates, Positive) {
    EXPECT_TRUE(is_positive(1e-9));
    EXPECT_FALSE(is_positive(0.0));
    EXPECT_FALSE(is_positive(-1.0));
    EXPECT_FALSE(is_positive(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(is_positive(std::nan("")));
}

TEST(Validation_Predicates, PercentageInclusive) {
    EXPECT_TRUE(is_percentage(0.0));
    EXPECT_TRUE(is_percentage(100.0));
    EXPECT_FALSE(is_percentage(-0.01));
    EXPECT_FALSE(is_percentage(100.01));
}

TEST(Validation_Predicates, RateExclusive) {
    EXPECT_TRUE(is_rate(0.0));
    EXPECT_TRUE(is_rate(-0.99));
    EXPECT_TRUE(is_rate(9.99));
    EXPECT_FALSE(is_rate(-1.0));
    EXPECT_FALSE(is_rate(10.0));
    EXPECT_FALSE(is_rate(std::nan("")));
}

// ─── Simple modes ─────────────────────────────────────────────────────────────

TEST(Validation_Irr, ValidRequest_NoIssues) {
    EXPECT_TRUE(is_valid(IrrRequest{100.0, 150.0, 2.0}));
}

TEST(Validation_Irr, EveryBadFieldReported) {
    const auto issues = validate(IrrRequest{0.0, -5.0, std::nan("")});
    ASSERT_EQ(issues.size(), 3u);
    EXPECT_EQ(issues[0].field, "initial");
    EXPECT_EQ(issues[0].message, "Initial investment must be a positive number");
    EXPECT_EQ(issues[1].field, "outcome");
    EXPECT_EQ(issues[2].field, "years");
}

TEST(Validation_Outcome, RateOutOfRange) {
    const auto issues = validate(OutcomeRequest{100.0, -1.0, 2.0});
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].field, "irr");
    EXPECT_EQ(issues[0].message, "IRR must be greater than -100% and less than 1000%");
    EXPECT_FALSE(is_valid(OutcomeRequest{100.0, 10.0, 2.0}));
}

TEST(Validation_InitialInvestment, ChecksOutcomeRateYears) {
    EXPECT_TRUE(is_valid(InitialInvestmentRequest{200.0, 0.1, 5.0}));
    const auto issues = validate(InitialInvestmentRequest{0.0, 0.1, 5.0});
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].field, "outcome");
}

// ─── Blended ──────────────────────────────────────────────────────────────────

TEST(Validation_Blended, FollowOnBeforeInitialDate) {
    BlendedIrrRequest r{100.0, 200.0, 2.0, {}, kBase};
    r.follow_ons.push_back(FollowOnInvestment::make(
        FollowOnSpec{.timing = AbsoluteTiming{make_date(2023, 12, 31)},
                     .amount = 10.0},
        kBase).value());

    const auto issues = validate(r);
    const auto* issue = find_field(issues, "follow_ons[0].date");
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->message, "Follow-on date must not precede the initial investment");
}

TEST(Validation_Blended, CustomFieldsCheckedByValuationType) {
    BlendedIrrRequest r{100.0, 200.0, 2.0, {}, kBase};
    r.follow_ons.push_back(FollowOnInvestment::make(
        FollowOnSpec{.investment_type = InvestmentType::Sell,
                     .amount          = 10.0,
                     .valuation_mode  = ValuationMode::Custom,
                     .valuation_type  = ValuationType::Specified,
                     .valuation       = 0.0},
        kBase).value());
    r.follow_ons.push_back(FollowOnInvestment::make(
        FollowOnSpec{.investment_type = InvestmentType::Sell,
                     .amount          = 10.0,
                     .valuation_mode  = ValuationMode::Custom,
                     .valuation_type  = ValuationType::Computed,
                     .custom_irr      = 12.0},
        kBase).value());

    const auto issues = validate(r);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].field, "follow_ons[0].valuation");
    EXPECT_EQ(issues[0].message, "Valuation must be a positive number");
    EXPECT_EQ(issues[1].field, "follow_ons[1].custom_irr");
}

TEST(Validation_Blended, TagAlongIgnoresCustomFields) {
    BlendedIrrRequest r{100.0, 200.0, 2.0, {}, kBase};
    r.follow_ons.push_back(FollowOnInvestment::make(
        FollowOnSpec{.amount = 10.0, .valuation = 0.0, .custom_irr = 50.0},
        kBase).value());
    EXPECT_TRUE(is_valid(r));
}

TEST(Validation_Blended, InvalidInitialDate) {
    const BlendedIrrRequest r{100.0, 200.0, 2.0, {}, make_date(2023, 2, 30)};
    EXPECT_TRUE(has_field(validate(r), "initial_date"));
}

// ─── Portfolio ────────────────────────────────────────────────────────────────

TEST(Validation_Portfolio, PercentMessages) {
    const PortfolioUnitRequest r{
        .investment_amount = 1000.0,
        .unit_price        = 10.0,
        .success_rate      = 120.0,
        .outcome_per_unit  = 20.0,
        .investor_share    = 100.0,
        .years             = 1.0,
        .fee_percentage    = -1.0,
    };
    const auto issues = validate(r);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].field, "success_rate");
    EXPECT_EQ(issues[0].message, "Success rate must be between 0% and 100%");
    EXPECT_EQ(issues[1].field, "fee_percentage");
}

TEST(Validation_Portfolio, DefaultsAreValidWhenRequiredFieldsSet) {
    const PortfolioUnitRequest r{
        .investment_amount = 1000.0,
        .unit_price        = 10.0,
        .success_rate      = 50.0,
        .outcome_per_unit  = 20.0,
        .years             = 1.0,
    };
    EXPECT_TRUE(is_valid(r));
}

TEST(Validation_PortfolioBlended, BatchFieldsIndexed) {
    PortfolioUnitBlendedRequest r{
        .initial_batch    = {1000.0, 10.0, kBase},
        .years            = 2.0,
        .success_rate     = 100.0,
        .outcome_per_unit = 30.0,
    };
    r.initial_date = kBase;
    r.follow_on_batches.push_back({1000.0, 20.0, kBase});
    r.follow_on_batches.push_back({500.0, 0.0, kBase});

    const auto issues = validate(r);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].field, "follow_on_batches[1].unit_price");
    EXPECT_EQ(issues[0].message, "Unit price must be a positive number");
}

TEST(Validation_PortfolioBlended, InitialBatchChecked) {
    PortfolioUnitBlendedRequest r{
        .initial_batch    = {0.0, 10.0, kBase},
        .years            = 2.0,
        .success_rate     = 100.0,
        .outcome_per_unit = 30.0,
    };
    r.initial_date = kBase;
    EXPECT_TRUE(has_field(validate(r), "initial_batch.investment_amount"));
}

TEST(Validation_PortfolioBlended, BatchBeforeInitialDateRejected) {
    PortfolioUnitBlendedRequest r{
        .initial_batch    = {1000.0, 10.0, kBase},
        .years            = 2.0,
        .success_rate     = 100.0,
        .outcome_per_unit = 30.0,
    };
    r.initial_date = kBase;
    r.follow_on_batches.push_back({500.0, 10.0, make_date(2023, 6, 1)});

    const auto issues = validate(r);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].field, "follow_on_batches[0].investment_date");
    EXPECT_EQ(issues[0].message, "Follow-on date must not precede the initial investment");
}

TEST(Validation_PortfolioBlended, BatchOnInitialDateAccepted) {
    PortfolioUnitBlendedRequest r{
        .initial_batch    = {1000.0, 10.0, kBase},
        .years            = 2.0,
        .success_rate     = 100.0,
        .outcome_per_unit = 30.0,
    };
    r.initial_date = kBase;
    r.follow_on_batches.push_back({500.0, 10.0, kBase});
    EXPECT_TRUE(is_valid(r));
}

TEST(Validation_PortfolioBlended, InvalidBatchDate) {
    PortfolioUnitBlendedRequest r{
        .initial_batch    = {1000.0, 10.0, kBase},
        .years            = 2.0,
        .success_rate     = 100.0,
        .outcome_per_unit = 30.0,
    };
    r.initial_date = kBase;
    r.follow_on_batches.push_back(
        {500.0, 10.0, Date{std::chrono::year{2024}, std::chrono::month{2}, std::chrono::day{30}}});

    const auto issues = validate(r);
    const auto* issue = find_field(issues, "follow_on_batches[0].investment_date");
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->message, "Date is not a valid calendar date");
}
