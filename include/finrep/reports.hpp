#pragma once

/// @file include/finrep/reports.hpp
/// @brief Report records produced by the calculators and the health engine.
///
/// All records are plain value types, constructed fresh per request and
/// never mutated afterwards. `to_string()` renders a single-line summary for
/// logs and the CLI.

#include "finrep/constants.hpp"
#include "finrep/types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace finrep {

/// Amount and share allocated to one remittance category.
struct CategoryBreakdown {
    Category      category   = Category::Spending;
    Amount        amount     = 0;
    std::uint32_t percentage = 0;

    friend bool operator==(const CategoryBreakdown&, const CategoryBreakdown&) = default;
};

/// Remittance split for one period. The breakdown always holds one entry per
/// category in `constants::CATEGORY_ORDER`.
struct RemittanceSummary {
    Amount total_received  = 0;
    Amount total_allocated = 0;
    std::array<CategoryBreakdown, constants::CATEGORY_COUNT> category_breakdown{};
    Timestamp period_start = 0;
    Timestamp period_end   = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const RemittanceSummary&, const RemittanceSummary&) = default;
};

/// Aggregate progress across all of an owner's savings goals.
struct SavingsReport {
    std::uint32_t total_goals           = 0;
    std::uint32_t completed_goals       = 0;
    Amount        total_target          = 0;
    Amount        total_saved           = 0;
    std::uint32_t completion_percentage = 0;
    Timestamp     period_start          = 0;
    Timestamp     period_end            = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const SavingsReport&, const SavingsReport&) = default;
};

/// Paid/unpaid/overdue breakdown of an owner's bills created in a period.
struct BillComplianceReport {
    std::uint32_t total_bills           = 0;
    std::uint32_t paid_bills            = 0;
    std::uint32_t unpaid_bills          = 0;
    std::uint32_t overdue_bills         = 0;
    Amount        total_amount          = 0;
    Amount        paid_amount           = 0;
    Amount        unpaid_amount         = 0;
    std::uint32_t compliance_percentage = 0;
    Timestamp     period_start          = 0;
    Timestamp     period_end            = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const BillComplianceReport&, const BillComplianceReport&) = default;
};

/// Coverage and premium totals over an owner's active policies.
struct InsuranceReport {
    std::uint32_t active_policies           = 0;
    Amount        total_coverage            = 0;
    Amount        monthly_premium           = 0;
    Amount        annual_premium            = 0;
    std::uint32_t coverage_to_premium_ratio = 0;
    Timestamp     period_start              = 0;
    Timestamp     period_end                = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const InsuranceReport&, const InsuranceReport&) = default;
};

/// Composite 0–100 score. `score` is always the sum of the three parts.
struct HealthScore {
    std::uint32_t score           = 0;
    std::uint32_t savings_score   = 0;
    std::uint32_t bills_score     = 0;
    std::uint32_t insurance_score = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const HealthScore&, const HealthScore&) = default;
};

/// Period-over-period comparison of a single amount.
struct TrendData {
    Amount       current_amount    = 0;
    Amount       previous_amount   = 0;
    Amount       change_amount     = 0;
    std::int32_t change_percentage = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const TrendData&, const TrendData&) = default;
};

/// Everything the engine knows about one owner for one period.
struct FinancialHealthReport {
    HealthScore          health_score;
    RemittanceSummary    remittance_summary;
    SavingsReport        savings_report;
    BillComplianceReport bill_compliance;
    InsuranceReport      insurance_report;
    Timestamp            generated_at = 0;

    /// Multi-line rendering of every section.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const FinancialHealthReport&, const FinancialHealthReport&) = default;
};

} // namespace finrep
