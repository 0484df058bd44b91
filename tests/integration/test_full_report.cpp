/// @file tests/integration/test_full_report.cpp
/// @brief End-to-end: configured engine over in-memory collaborators,
///        composite report, storage round trip, failure atomicity.

#include <gtest/gtest.h>
#include "finrep/error.hpp"
#include "support/test_world.hpp"

#include <stdexcept>

using namespace finrep;
using namespace finrep::testing;

namespace {

class DownSink final : public EventSink {
public:
    void publish(const EventRecord&) override {
        throw std::runtime_error("event transport down");
    }
};

/// Alice: two goals (1500/3000 saved), three bills in [100, 200] with one
/// overdue, one active policy; Bob has records that must never leak in.
void seed_household(TestWorld& w) {
    w.goals.add(goal(1, ALICE, 1'000, 1'000));
    w.goals.add(goal(2, ALICE, 2'000, 500));
    w.goals.add(goal(3, BOB, 9'000, 0));

    w.bills.add(bill(1, ALICE, 300, true, 120, 400));
    w.bills.add(bill(2, ALICE, 200, false, 150, 900));     // overdue at now = 1000
    w.bills.add(bill(3, ALICE, 100, false, 200, 5'000));
    w.bills.add(bill(4, ALICE, 999, false, 250, 5'000));   // outside period
    w.bills.add(bill(5, BOB, 50, false, 150, 10));

    w.insurance.add(policy(1, ALICE, 100, 60'000));
    w.insurance.add(policy(2, ALICE, 80, 1'000, /*active=*/false));
}

} // anonymous namespace

TEST(FullReport, AssemblesEverySection) {
    TestWorld w;
    w.configure();
    seed_household(w);

    const auto r = w.engine.get_financial_health_report(ALICE, 10'000, 100, 200);

    // Health: progress 50 → 20, overdue → 20, covered → 20.
    EXPECT_EQ(r.health_score.savings_score, 20u);
    EXPECT_EQ(r.health_score.bills_score, 20u);
    EXPECT_EQ(r.health_score.insurance_score, 20u);
    EXPECT_EQ(r.health_score.score, 60u);

    // Remittance: split {50,30,15,5}.
    EXPECT_EQ(r.remittance_summary.total_received, 10'000);
    EXPECT_EQ(r.remittance_summary.total_allocated, 10'000);
    EXPECT_EQ(r.remittance_summary.category_breakdown[0].amount, 5'000);
    EXPECT_EQ(r.remittance_summary.category_breakdown[1].amount, 3'000);
    EXPECT_EQ(r.remittance_summary.category_breakdown[2].amount, 1'500);
    EXPECT_EQ(r.remittance_summary.category_breakdown[3].amount, 500);
    EXPECT_EQ(r.remittance_summary.category_breakdown[3].category, Category::Insurance);

    // Savings: period ignored, Bob excluded.
    EXPECT_EQ(r.savings_report.total_goals, 2u);
    EXPECT_EQ(r.savings_report.completed_goals, 1u);
    EXPECT_EQ(r.savings_report.completion_percentage, 50u);

    // Bills: only Alice's bills created within [100, 200].
    EXPECT_EQ(r.bill_compliance.total_bills, 3u);
    EXPECT_EQ(r.bill_compliance.paid_bills, 1u);
    EXPECT_EQ(r.bill_compliance.overdue_bills, 1u);
    EXPECT_EQ(r.bill_compliance.total_amount, 600);
    EXPECT_EQ(r.bill_compliance.compliance_percentage, 33u);

    // Insurance: active policy only.
    EXPECT_EQ(r.insurance_report.active_policies, 1u);
    EXPECT_EQ(r.insurance_report.annual_premium, 1'200);
    EXPECT_EQ(r.insurance_report.coverage_to_premium_ratio, 5'000u);

    EXPECT_EQ(r.generated_at, 1'000u);
}

TEST(FullReport, SectionsMatchIndividualOperations) {
    TestWorld w;
    w.configure();
    seed_household(w);

    const auto r = w.engine.get_financial_health_report(ALICE, 10'000, 100, 200);
    EXPECT_EQ(r.health_score, w.engine.calculate_health_score(ALICE, 10'000));
    EXPECT_EQ(r.remittance_summary, w.engine.get_remittance_summary(ALICE, 10'000, 100, 200));
    EXPECT_EQ(r.savings_report, w.engine.get_savings_report(ALICE, 100, 200));
    EXPECT_EQ(r.bill_compliance, w.engine.get_bill_compliance_report(ALICE, 100, 200));
    EXPECT_EQ(r.insurance_report, w.engine.get_insurance_report(ALICE, 100, 200));
}

TEST(FullReport, PublishesReportGeneratedWithTimestamp) {
    TestWorld w;
    w.configure();
    w.clock.set(77'777);

    (void)w.engine.get_financial_health_report(ALICE, 0, 0, 0);

    const auto events = w.events.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ReportEvent::ReportGenerated);
    EXPECT_EQ(events[0].topic, "report");
    EXPECT_FALSE(events[0].subject.has_value());
    ASSERT_TRUE(events[0].value.has_value());
    EXPECT_EQ(*events[0].value, 77'777u);
}

TEST(FullReport, EmptyHousehold) {
    TestWorld w;
    w.configure();

    const auto r = w.engine.get_financial_health_report(ALICE, 0, 0, 100);
    EXPECT_EQ(r.health_score.score, 60u);
    EXPECT_EQ(r.bill_compliance.compliance_percentage, 100u);
    EXPECT_EQ(r.insurance_report.active_policies, 0u);
    EXPECT_EQ(r.insurance_report.coverage_to_premium_ratio, 0u);
    EXPECT_EQ(r.savings_report.completion_percentage, 0u);
}

TEST(FullReport, FailingCollaborator_NoEventNoPartialReport) {
    TestWorld w;
    w.configure();
    FailingSavingsGoals failing;
    w.directory.bind(DEFAULT_ADDRESSES.savings_goals, failing);

    try {
        (void)w.engine.get_financial_health_report(ALICE, 1'000, 0, 100);
        FAIL() << "expected ReportingError";
    } catch (const ReportingError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::CollaboratorFailure);
    }
    EXPECT_TRUE(w.events.events().empty());
    EXPECT_EQ(w.store.size(), 0u);
}

// ─── Storage round trip ───────────────────────────────────────────────────────

TEST(StoredReport, RoundTripAndEvent) {
    TestWorld w;
    w.configure();
    seed_household(w);

    const auto r = w.engine.get_financial_health_report(ALICE, 10'000, 100, 200);
    w.events.clear();
    w.engine.store_report(ALICE, r, 202'401);

    const auto got = w.engine.get_stored_report(ALICE, 202'401);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, r);

    const auto events = w.events.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ReportEvent::ReportStored);
    EXPECT_EQ(events[0].subject, ALICE);
    EXPECT_EQ(events[0].value, std::optional<std::uint64_t>{202'401});
}

TEST(StoredReport, OverwriteIsLastWriteWins) {
    TestWorld w;
    w.configure();
    seed_household(w);

    const auto first = w.engine.get_financial_health_report(ALICE, 10'000, 100, 200);
    w.clock.set(2'000);
    const auto second = w.engine.get_financial_health_report(ALICE, 20'000, 100, 200);

    w.engine.store_report(ALICE, first, 1);
    w.engine.store_report(ALICE, second, 1);

    const auto got = w.engine.get_stored_report(ALICE, 1);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, second);
    EXPECT_EQ(got->generated_at, 2'000u);
}

TEST(StoredReport, AbsentKeyAndOtherOwner) {
    TestWorld w;
    w.configure();
    w.engine.store_report(ALICE, FinancialHealthReport{}, 5);

    EXPECT_FALSE(w.engine.get_stored_report(ALICE, 6).has_value());
    EXPECT_FALSE(w.engine.get_stored_report(BOB, 5).has_value());
}

// ─── Trend through the engine ─────────────────────────────────────────────────

TEST(EngineTrend, ReferenceCases) {
    TestWorld w;
    const auto grow = w.engine.get_trend_analysis(ALICE, 150, 100);
    EXPECT_EQ(grow.change_amount, 50);
    EXPECT_EQ(grow.change_percentage, 50);

    EXPECT_EQ(w.engine.get_trend_analysis(ALICE, 50, 0).change_percentage, 100);
    EXPECT_EQ(w.engine.get_trend_analysis(ALICE, 0, 0).change_percentage, 0);
    EXPECT_TRUE(w.events.events().empty());
}

TEST(StoredReport, SinkFailure_TypedErrorAndNothingStored) {
    TestWorld w;
    w.configure();
    DownSink sink;
    core::ReportingEngine engine{
        core::ReportingContext{w.state, w.store, w.directory, w.clock, w.auth, sink}};

    FinancialHealthReport report;
    report.generated_at = 7;
    try {
        engine.store_report(ALICE, report, 1);
        FAIL() << "expected ReportingError";
    } catch (const ReportingError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::CollaboratorFailure);
    }
    EXPECT_EQ(w.store.size(), 0u);
    EXPECT_FALSE(engine.get_stored_report(ALICE, 1).has_value());
}
