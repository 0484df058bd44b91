/// @file src/core/report_format.cpp
/// @brief Text rendering of report records and events.

#include "finrep/events.hpp"
#include "finrep/reports.hpp"

#include <fmt/format.h>

#include <iterator>

namespace finrep {

// ─── RemittanceSummary ────────────────────────────────────────────────────────

std::string RemittanceSummary::to_string() const {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out),
        "Remittance  received={}  allocated={}  period=[{}, {}]",
        total_received, total_allocated, period_start, period_end);
    for (const auto& entry : category_breakdown) {
        fmt::format_to(std::back_inserter(out), "  {}={} ({}%)",
                       finrep::to_string(entry.category), entry.amount, entry.percentage);
    }
    return fmt::to_string(out);
}

// ─── SavingsReport ────────────────────────────────────────────────────────────

std::string SavingsReport::to_string() const {
    return fmt::format(
        "Savings     goals={}/{} complete  saved={}  target={}  progress={}%",
        completed_goals, total_goals, total_saved, total_target, completion_percentage);
}

// ─── BillComplianceReport ─────────────────────────────────────────────────────

std::string BillComplianceReport::to_string() const {
    return fmt::format(
        "Bills       total={} paid={} unpaid={} overdue={}  "
        "amount={} paid={} unpaid={}  compliance={}%",
        total_bills, paid_bills, unpaid_bills, overdue_bills,
        total_amount, paid_amount, unpaid_amount, compliance_percentage);
}

// ─── InsuranceReport ──────────────────────────────────────────────────────────

std::string InsuranceReport::to_string() const {
    return fmt::format(
        "Insurance   policies={}  coverage={}  premium={}/mo {}/yr  ratio={}%",
        active_policies, total_coverage, monthly_premium, annual_premium,
        coverage_to_premium_ratio);
}

// ─── HealthScore ──────────────────────────────────────────────────────────────

std::string HealthScore::to_string() const {
    return fmt::format("Health      score={}/100  savings={}  bills={}  insurance={}",
                       score, savings_score, bills_score, insurance_score);
}

// ─── TrendData ────────────────────────────────────────────────────────────────

std::string TrendData::to_string() const {
    return fmt::format("Trend       previous={}  current={}  change={} ({:+}%)",
                       previous_amount, current_amount, change_amount, change_percentage);
}

// ─── FinancialHealthReport ────────────────────────────────────────────────────

std::string FinancialHealthReport::to_string() const {
    return fmt::format(
        "Financial health report (generated at {})\n{}\n{}\n{}\n{}\n{}\n",
        generated_at,
        health_score.to_string(),
        remittance_summary.to_string(),
        savings_report.to_string(),
        bill_compliance.to_string(),
        insurance_report.to_string());
}

// ─── EventRecord ──────────────────────────────────────────────────────────────

std::string EventRecord::to_string() const {
    std::string out = fmt::format("{}:{}", topic, finrep::to_string(kind));
    if (subject) {
        out += fmt::format(" subject={}", subject->value);
    }
    if (value) {
        out += fmt::format(" value={}", *value);
    }
    return out;
}

} // namespace finrep
