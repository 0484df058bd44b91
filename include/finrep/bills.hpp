#pragma once

/// @file include/finrep/bills.hpp
/// @brief Bill Compliance Calculator.
///
/// # Module: Bill Compliance
///
/// ## Responsibility
/// Fetch every bill in the system, keep the owner's bills created inside the
/// period, and report paid/unpaid/overdue counts and amounts.
///
/// ## Filtering
/// A bill is kept iff `bill.owner == owner` and
/// `period_start <= bill.created_at <= period_end` (inclusive both ends).
/// An unpaid kept bill is overdue iff `due_date < now`.
///
/// ## Defaults
/// `compliance_percentage` is 100 when no bill is kept, unlike the 0
/// default of the savings and insurance reports.

#include "finrep/collaborators.hpp"
#include "finrep/reports.hpp"

#include <span>

namespace finrep {

class BillComplianceCalculator {
public:
    BillComplianceCalculator(const BillPaymentService& bills,
                             const LedgerClock& clock) noexcept
        : bills_(bills), clock_(clock) {}

    /// # Throws
    /// - `ReportingError{CollaboratorFailure}` on bill or clock failure
    /// - `ReportingError{ArithmeticOverflow}` if an amount total overflows
    [[nodiscard]] BillComplianceReport report(const Identity& owner,
                                              Timestamp period_start,
                                              Timestamp period_end) const;

    /// Filter and reduce an already-fetched, system-wide bill list.
    [[nodiscard]] static BillComplianceReport
    reduce(std::span<const Bill> all_bills,
           const Identity& owner,
           Timestamp period_start,
           Timestamp period_end,
           Timestamp now);

    /// True iff `bill` belongs to `owner` and was created inside the period.
    [[nodiscard]] static bool in_scope(const Bill& bill,
                                       const Identity& owner,
                                       Timestamp period_start,
                                       Timestamp period_end) noexcept;

private:
    const BillPaymentService& bills_;
    const LedgerClock&        clock_;
};

} // namespace finrep
