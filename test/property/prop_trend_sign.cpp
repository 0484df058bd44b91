/**
 * @file  prop_trend_sign.cpp
 * @brief Property: trend change is exact and its percentage never has the
 *        wrong sign.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_trend_sign
 *
 *   change_amount = current − previous            (exact for 64-bit inputs)
 *   previous > 0: sign(change_percentage) ∈ {0, sign(change_amount)}
 *   previous ≤ 0: change_percentage = 100 if current > 0, else 0
 */

#include <rapidcheck.h>
#include <cstdint>

#include "finrep/trend.hpp"

using namespace finrep;

int main() {
    bool ok = true;

    // ── Property 1: change is the exact difference ───────────────────────────
    ok &= rc::check(
        "trend_sign: change_amount == current - previous",
        [](std::int64_t current, std::int64_t previous) {
            const auto t = TrendAnalyzer::analyze(current, previous);
            RC_ASSERT(t.change_amount == static_cast<Amount>(current) - previous);
            RC_ASSERT(t.current_amount == static_cast<Amount>(current));
            RC_ASSERT(t.previous_amount == static_cast<Amount>(previous));
        }
    );

    // ── Property 2: percentage sign follows change when previous > 0 ─────────
    ok &= rc::check(
        "trend_sign: percentage never opposes the change",
        [](std::int64_t current, std::int64_t previous) {
            RC_PRE(previous > 0);
            const auto t = TrendAnalyzer::analyze(current, previous);
            if (t.change_percentage > 0) RC_ASSERT(t.change_amount > 0);
            if (t.change_percentage < 0) RC_ASSERT(t.change_amount < 0);
            if (t.change_amount == 0) RC_ASSERT(t.change_percentage == 0);
        }
    );

    // ── Property 3: non-positive baseline ────────────────────────────────────
    ok &= rc::check(
        "trend_sign: non-positive previous yields 100 or 0",
        [](std::int64_t current, std::int64_t previous) {
            RC_PRE(previous <= 0);
            const auto t = TrendAnalyzer::analyze(current, previous);
            RC_ASSERT(t.change_percentage == (current > 0 ? 100 : 0));
        }
    );

    return ok ? 0 : 1;
}
