/**
 * @file  prop_savings_bounds.cpp
 * @brief Property: savings completion stays within [0, 100] and goal counts
 *        are consistent, whatever the goal amounts.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_savings_bounds
 *
 *   completion_percentage ∈ [0, 100]
 *   completed_goals ≤ total_goals = |goals|
 *   total_target = Σ target, total_saved = Σ current (exact in 128 bits)
 */

#include <rapidcheck.h>
#include <cstdint>
#include <vector>

#include "finrep/savings.hpp"

using namespace finrep;

namespace {

std::vector<SavingsGoal> make_goals(const std::vector<std::int64_t>& targets,
                                    const std::vector<std::int64_t>& saved) {
    std::vector<SavingsGoal> out;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        SavingsGoal g;
        g.id             = static_cast<std::uint32_t>(i);
        g.owner          = Identity{"alice"};
        g.target_amount  = targets[i];
        g.current_amount = saved.empty() ? 0 : saved[i % saved.size()];
        out.push_back(g);
    }
    return out;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: percentage bounded ───────────────────────────────────────
    ok &= rc::check(
        "savings_bounds: completion_percentage in [0, 100]",
        [](const std::vector<std::int64_t>& targets,
           const std::vector<std::int64_t>& saved) {
            const auto goals = make_goals(targets, saved);
            const auto r = SavingsProgressCalculator::reduce(goals, 0, 0);
            RC_ASSERT(r.completion_percentage <= 100u);
            if (r.total_target <= 0) {
                RC_ASSERT(r.completion_percentage == 0u);
            }
        }
    );

    // ── Property 2: counts consistent ────────────────────────────────────────
    ok &= rc::check(
        "savings_bounds: completed_goals <= total_goals == goal count",
        [](const std::vector<std::int64_t>& targets,
           const std::vector<std::int64_t>& saved) {
            const auto goals = make_goals(targets, saved);
            const auto r = SavingsProgressCalculator::reduce(goals, 0, 0);
            RC_ASSERT(r.total_goals == goals.size());
            RC_ASSERT(r.completed_goals <= r.total_goals);
        }
    );

    // ── Property 3: 64-bit inputs never overflow the 128-bit totals ──────────
    ok &= rc::check(
        "savings_bounds: totals are exact sums",
        [](const std::vector<std::int64_t>& targets,
           const std::vector<std::int64_t>& saved) {
            const auto goals = make_goals(targets, saved);
            Amount target_sum = 0;
            Amount saved_sum  = 0;
            for (const auto& g : goals) {
                target_sum += g.target_amount;
                saved_sum  += g.current_amount;
            }
            const auto r = SavingsProgressCalculator::reduce(goals, 0, 0);
            RC_ASSERT(r.total_target == target_sum);
            RC_ASSERT(r.total_saved == saved_sum);
        }
    );

    return ok ? 0 : 1;
}
