/// @file src/bills/bill_compliance.cpp
/// @brief Bill Compliance Calculator.

#include "finrep/bills.hpp"
#include "finrep/constants.hpp"

#include "../core/checked_math.hpp"
#include "../core/collaborator_call.hpp"

#include <vector>

namespace finrep {

// ─── in_scope ─────────────────────────────────────────────────────────────────

bool BillComplianceCalculator::in_scope(const Bill& bill,
                                        const Identity& owner,
                                        Timestamp period_start,
                                        Timestamp period_end) noexcept {
    if (bill.owner != owner) return false;
    // Inclusive on both ends.
    return bill.created_at >= period_start && bill.created_at <= period_end;
}

// ─── reduce ───────────────────────────────────────────────────────────────────

BillComplianceReport BillComplianceCalculator::reduce(std::span<const Bill> all_bills,
                                                      const Identity& owner,
                                                      Timestamp period_start,
                                                      Timestamp period_end,
                                                      Timestamp now) {
    BillComplianceReport out{};
    out.period_start = period_start;
    out.period_end   = period_end;

    for (const auto& bill : all_bills) {
        if (!in_scope(bill, owner, period_start, period_end)) {
            continue;
        }

        ++out.total_bills;
        out.total_amount = core::checked_add(out.total_amount, bill.amount,
                                             "bills total_amount");

        if (bill.paid) {
            ++out.paid_bills;
            out.paid_amount = core::checked_add(out.paid_amount, bill.amount,
                                                "bills paid_amount");
        } else {
            ++out.unpaid_bills;
            out.unpaid_amount = core::checked_add(out.unpaid_amount, bill.amount,
                                                  "bills unpaid_amount");
            if (bill.due_date < now) {
                ++out.overdue_bills;
            }
        }
    }

    if (out.total_bills > 0) {
        // 64-bit intermediate: paid_bills * 100 can exceed 32 bits.
        const std::uint64_t scaled =
            static_cast<std::uint64_t>(out.paid_bills) * constants::PERCENT_SCALE;
        out.compliance_percentage = static_cast<std::uint32_t>(scaled / out.total_bills);
    } else {
        out.compliance_percentage = constants::VACUOUS_COMPLIANCE_PERCENTAGE;
    }

    return out;
}

// ─── report ───────────────────────────────────────────────────────────────────

BillComplianceReport BillComplianceCalculator::report(const Identity& owner,
                                                      Timestamp period_start,
                                                      Timestamp period_end) const {
    // The collaborator is not owner-scoped; filtering happens in reduce().
    const std::vector<Bill> all_bills = core::collaborator_call(
        "bill_payments.get_all_bills", [&] { return bills_.get_all_bills(); });
    const Timestamp now = core::collaborator_call(
        "ledger_clock.now", [&] { return clock_.now(); });
    return reduce(all_bills, owner, period_start, period_end, now);
}

} // namespace finrep
