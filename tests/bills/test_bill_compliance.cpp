#include <gtest/gtest.h>
#include "finrep/bills.hpp"
#include "finrep/in_memory.hpp"
#include "support/test_world.hpp"

#include <vector>

using namespace finrep;
using finrep::testing::bill;
using finrep::testing::ALICE;
using finrep::testing::BOB;

// ─── in_scope ─────────────────────────────────────────────────────────────────

TEST(BillScope, InclusiveBothEnds) {
    EXPECT_TRUE(BillComplianceCalculator::in_scope(bill(1, ALICE, 1, false, 100, 0), ALICE, 100, 200));
    EXPECT_TRUE(BillComplianceCalculator::in_scope(bill(1, ALICE, 1, false, 200, 0), ALICE, 100, 200));
    EXPECT_FALSE(BillComplianceCalculator::in_scope(bill(1, ALICE, 1, false, 99, 0), ALICE, 100, 200));
    EXPECT_FALSE(BillComplianceCalculator::in_scope(bill(1, ALICE, 1, false, 201, 0), ALICE, 100, 200));
}

TEST(BillScope, OtherOwner_Excluded) {
    EXPECT_FALSE(BillComplianceCalculator::in_scope(bill(1, BOB, 1, false, 150, 0), ALICE, 100, 200));
}

// ─── reduce ───────────────────────────────────────────────────────────────────

TEST(BillReduce, NoBills_FullCompliance) {
    const auto r = BillComplianceCalculator::reduce({}, ALICE, 0, 100, 50);
    EXPECT_EQ(r.total_bills, 0u);
    EXPECT_EQ(r.compliance_percentage, 100u);
    EXPECT_EQ(r.total_amount, 0);
}

TEST(BillReduce, MixedBills_CountsAmountsAndOverdue) {
    const Timestamp now = 500;
    const std::vector<Bill> bills{
        bill(1, ALICE, 100, true, 150, 300),    // paid
        bill(2, ALICE, 200, false, 160, 400),   // unpaid, overdue (400 < 500)
        bill(3, ALICE, 300, false, 170, 500),   // unpaid, due == now → not overdue
        bill(4, ALICE, 400, false, 180, 900),   // unpaid, not overdue
        bill(5, BOB, 999, false, 150, 0),       // other owner
        bill(6, ALICE, 777, false, 50, 0),      // before period
    };
    const auto r = BillComplianceCalculator::reduce(bills, ALICE, 100, 200, now);

    EXPECT_EQ(r.total_bills, 4u);
    EXPECT_EQ(r.paid_bills, 1u);
    EXPECT_EQ(r.unpaid_bills, 3u);
    EXPECT_EQ(r.overdue_bills, 1u);
    EXPECT_EQ(r.total_amount, 1'000);
    EXPECT_EQ(r.paid_amount, 100);
    EXPECT_EQ(r.unpaid_amount, 900);
    EXPECT_EQ(r.compliance_percentage, 25u);
    EXPECT_EQ(r.paid_bills + r.unpaid_bills, r.total_bills);
    EXPECT_EQ(r.paid_amount + r.unpaid_amount, r.total_amount);
}

TEST(BillReduce, CompliancePercentageTruncates) {
    const std::vector<Bill> bills{
        bill(1, ALICE, 1, true, 10, 0),
        bill(2, ALICE, 1, false, 10, 99),
        bill(3, ALICE, 1, false, 10, 99),
    };
    const auto r = BillComplianceCalculator::reduce(bills, ALICE, 0, 100, 0);
    EXPECT_EQ(r.compliance_percentage, 33u);
}

TEST(BillReduce, UnpaidOwnedBillOutsidePeriod_Excluded) {
    const std::vector<Bill> bills{bill(1, ALICE, 50, false, 1'000, 0)};
    const auto r = BillComplianceCalculator::reduce(bills, ALICE, 0, 999, 5'000);
    EXPECT_EQ(r.total_bills, 0u);
    EXPECT_EQ(r.overdue_bills, 0u);
    EXPECT_EQ(r.compliance_percentage, 100u);
}

// ─── report ───────────────────────────────────────────────────────────────────

TEST(BillReport, UsesAllBillsAndClock) {
    const InMemoryBillPayments service({
        bill(1, ALICE, 10, false, 5, 20),
        bill(2, BOB, 10, false, 5, 20),
    });
    FixedClock clock(21);
    const BillComplianceCalculator calc(service, clock);

    auto r = calc.report(ALICE, 0, 10);
    EXPECT_EQ(r.total_bills, 1u);
    EXPECT_EQ(r.overdue_bills, 1u);
    EXPECT_EQ(r.compliance_percentage, 0u);

    clock.set(20);
    r = calc.report(ALICE, 0, 10);
    EXPECT_EQ(r.overdue_bills, 0u);
}
