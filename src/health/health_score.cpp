/// @file src/health/health_score.cpp
/// @brief Health Score Engine.

#include "finrep/health_score.hpp"
#include "finrep/constants.hpp"

#include "../core/checked_math.hpp"
#include "../core/collaborator_call.hpp"

#include <algorithm>
#include <vector>

namespace finrep {

// ─── savings_score ────────────────────────────────────────────────────────────

std::uint32_t HealthScoreEngine::savings_score(std::span<const SavingsGoal> goals) {
    Amount total_target = 0;
    Amount total_saved  = 0;
    for (const auto& goal : goals) {
        total_target = core::checked_add(total_target, goal.target_amount,
                                         "health total_target");
        total_saved  = core::checked_add(total_saved, goal.current_amount,
                                         "health total_saved");
    }

    if (total_target <= 0) {
        return constants::SAVINGS_SCORE_NO_GOALS;
    }

    const std::uint32_t progress = core::saturate_u32(
        core::scaled_percent(total_saved, total_target, "health savings progress"));
    if (progress > constants::PERCENT_SCALE) {
        return constants::SAVINGS_SCORE_MAX;
    }
    return static_cast<std::uint32_t>(
        progress * constants::SAVINGS_SCORE_MAX / constants::PERCENT_SCALE);
}

// ─── bills_score ──────────────────────────────────────────────────────────────

std::uint32_t HealthScoreEngine::bills_score(std::span<const Bill> unpaid_bills,
                                             Timestamp now) noexcept {
    if (unpaid_bills.empty()) {
        return constants::BILLS_SCORE_CLEAR;
    }
    const bool any_overdue = std::any_of(
        unpaid_bills.begin(), unpaid_bills.end(),
        [now](const Bill& b) { return b.due_date < now; });
    return any_overdue ? constants::BILLS_SCORE_OVERDUE : constants::BILLS_SCORE_UNPAID;
}

// ─── insurance_score ──────────────────────────────────────────────────────────

std::uint32_t
HealthScoreEngine::insurance_score(std::span<const InsurancePolicy> active_policies) noexcept {
    return active_policies.empty() ? constants::INSURANCE_SCORE_UNCOVERED
                                   : constants::INSURANCE_SCORE_COVERED;
}

// ─── compose ──────────────────────────────────────────────────────────────────

HealthScore HealthScoreEngine::compose(std::uint32_t savings,
                                       std::uint32_t bills,
                                       std::uint32_t insurance) noexcept {
    return HealthScore{
        .score           = savings + bills + insurance,
        .savings_score   = savings,
        .bills_score     = bills,
        .insurance_score = insurance,
    };
}

// ─── calculate ────────────────────────────────────────────────────────────────

HealthScore HealthScoreEngine::calculate(const Identity& owner) const {
    const std::vector<SavingsGoal> goals = core::collaborator_call(
        "savings_goals.get_all_goals", [&] { return goals_.get_all_goals(owner); });
    const std::uint32_t savings = savings_score(goals);

    const std::vector<Bill> unpaid = core::collaborator_call(
        "bill_payments.get_unpaid_bills", [&] { return bills_.get_unpaid_bills(owner); });
    std::uint32_t bills = constants::BILLS_SCORE_CLEAR;
    if (!unpaid.empty()) {
        const Timestamp now = core::collaborator_call(
            "ledger_clock.now", [&] { return clock_.now(); });
        bills = bills_score(unpaid, now);
    }

    const std::vector<InsurancePolicy> policies = core::collaborator_call(
        "insurance.get_active_policies",
        [&] { return insurance_.get_active_policies(owner); });
    const std::uint32_t insurance = insurance_score(policies);

    return compose(savings, bills, insurance);
}

} // namespace finrep
