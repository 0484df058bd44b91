#pragma once

/// @file include/finrep/health_score.hpp
/// @brief Health Score Engine: composite 0–100 financial health metric.
///
/// # Module: Health Score
///
/// ## Responsibility
/// Derive three bounded sub-scores from freshly fetched upstream data and sum
/// them. No calculator output is reused; every invocation makes its own
/// three collaborator queries.
///
/// ## Scoring
/// | Part      | Range      | Rule                                                     |
/// |-----------|------------|----------------------------------------------------------|
/// | Savings   | 0–40       | progress = saved*100/target; 40 if > 100 else progress*40/100; 20 if target == 0 |
/// | Bills     | {20,35,40} | 40 no unpaid; 35 unpaid but none overdue; 20 any overdue |
/// | Insurance | {0,20}     | 20 if any active policy                                  |
///
/// All divisions truncate. Negative progress scores 0.
///
/// ## Guarantees
/// - `score == savings_score + bills_score + insurance_score`
/// - `score <= constants::HEALTH_SCORE_MAX`

#include "finrep/collaborators.hpp"
#include "finrep/reports.hpp"

#include <cstdint>
#include <span>

namespace finrep {

class HealthScoreEngine {
public:
    HealthScoreEngine(const SavingsGoalService& goals,
                      const BillPaymentService& bills,
                      const InsuranceService& insurance,
                      const LedgerClock& clock) noexcept
        : goals_(goals), bills_(bills), insurance_(insurance), clock_(clock) {}

    /// Fetch goals, unpaid bills and active policies for `owner` and score.
    ///
    /// # Throws
    /// - `ReportingError{CollaboratorFailure}` on any upstream failure
    /// - `ReportingError{ArithmeticOverflow}` if goal totals overflow
    [[nodiscard]] HealthScore calculate(const Identity& owner) const;

    [[nodiscard]] static std::uint32_t savings_score(std::span<const SavingsGoal> goals);

    [[nodiscard]] static std::uint32_t bills_score(std::span<const Bill> unpaid_bills,
                                                   Timestamp now) noexcept;

    [[nodiscard]] static std::uint32_t
    insurance_score(std::span<const InsurancePolicy> active_policies) noexcept;

    /// Combine three sub-scores into a `HealthScore`.
    [[nodiscard]] static HealthScore compose(std::uint32_t savings,
                                             std::uint32_t bills,
                                             std::uint32_t insurance) noexcept;

private:
    const SavingsGoalService& goals_;
    const BillPaymentService& bills_;
    const InsuranceService&   insurance_;
    const LedgerClock&        clock_;
};

} // namespace finrep
