#pragma once

/// @file include/finrep/savings.hpp
/// @brief Savings Progress Calculator.
///
/// Reduces every savings goal of an owner into totals, a completion count,
/// and a completion percentage. Period bounds are carried into the report
/// but do not filter goals: a goal counts whatever its target date.

#include "finrep/collaborators.hpp"
#include "finrep/reports.hpp"

#include <span>

namespace finrep {

class SavingsProgressCalculator {
public:
    explicit SavingsProgressCalculator(const SavingsGoalService& goals) noexcept
        : goals_(goals) {}

    /// Fetch the owner's goals and reduce them.
    ///
    /// # Throws
    /// - `ReportingError{CollaboratorFailure}` if the goal query fails
    /// - `ReportingError{ArithmeticOverflow}` if a total exceeds 128 bits
    [[nodiscard]] SavingsReport report(const Identity& owner,
                                       Timestamp period_start,
                                       Timestamp period_end) const;

    /// Reduce an already-fetched goal list.
    ///
    /// A goal is complete when `current_amount >= target_amount`.
    /// `completion_percentage` is `total_saved * 100 / total_target`
    /// truncated and clamped into [0, 100], or 0 when `total_target <= 0`.
    /// An over-saved household reports 100, not the raw ratio (350 for 3500
    /// saved against 1000); the raw ratio is `total_saved` over `total_target`.
    [[nodiscard]] static SavingsReport reduce(std::span<const SavingsGoal> goals,
                                              Timestamp period_start,
                                              Timestamp period_end);

private:
    const SavingsGoalService& goals_;
};

} // namespace finrep
