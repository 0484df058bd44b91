/// @file src/savings/savings_progress.cpp
/// @brief Savings Progress Calculator.

#include "finrep/savings.hpp"

#include "../core/checked_math.hpp"
#include "../core/collaborator_call.hpp"

#include <vector>

namespace finrep {

// ─── reduce ───────────────────────────────────────────────────────────────────

SavingsReport SavingsProgressCalculator::reduce(std::span<const SavingsGoal> goals,
                                                Timestamp period_start,
                                                Timestamp period_end) {
    SavingsReport out{};
    out.period_start = period_start;
    out.period_end   = period_end;

    for (const auto& goal : goals) {
        out.total_target = core::checked_add(out.total_target, goal.target_amount,
                                             "savings total_target");
        out.total_saved  = core::checked_add(out.total_saved, goal.current_amount,
                                             "savings total_saved");
        if (goal.current_amount >= goal.target_amount) {
            ++out.completed_goals;
        }
        ++out.total_goals;
    }

    if (out.total_target > 0) {
        out.completion_percentage = core::clamp_percent(
            core::scaled_percent(out.total_saved, out.total_target,
                                 "savings completion_percentage"));
    }

    return out;
}

// ─── report ───────────────────────────────────────────────────────────────────

SavingsReport SavingsProgressCalculator::report(const Identity& owner,
                                                Timestamp period_start,
                                                Timestamp period_end) const {
    // Period bounds do not filter goals.
    const std::vector<SavingsGoal> goals = core::collaborator_call(
        "savings_goals.get_all_goals", [&] { return goals_.get_all_goals(owner); });
    return reduce(goals, period_start, period_end);
}

} // namespace finrep
