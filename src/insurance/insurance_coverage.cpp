/// @file src/insurance/insurance_coverage.cpp
/// @brief Insurance Coverage Calculator.

#include "finrep/insurance.hpp"
#include "finrep/constants.hpp"

#include "../core/checked_math.hpp"
#include "../core/collaborator_call.hpp"

#include <vector>

namespace finrep {

InsuranceReport InsuranceCoverageCalculator::reduce(
    std::span<const InsurancePolicy> active_policies,
    Amount monthly_premium,
    Timestamp period_start,
    Timestamp period_end) {
    InsuranceReport out{};
    out.period_start    = period_start;
    out.period_end      = period_end;
    out.monthly_premium = monthly_premium;

    for (const auto& policy : active_policies) {
        out.total_coverage = core::checked_add(out.total_coverage, policy.coverage_amount,
                                               "insurance total_coverage");
        ++out.active_policies;
    }

    out.annual_premium = core::checked_mul(monthly_premium, constants::MONTHS_PER_YEAR,
                                           "insurance annual_premium");

    if (out.annual_premium > 0) {
        out.coverage_to_premium_ratio = core::saturate_u32(
            core::scaled_percent(out.total_coverage, out.annual_premium,
                                 "insurance coverage_to_premium_ratio"));
    }

    return out;
}

InsuranceReport InsuranceCoverageCalculator::report(const Identity& owner,
                                                    Timestamp period_start,
                                                    Timestamp period_end) const {
    const std::vector<InsurancePolicy> policies = core::collaborator_call(
        "insurance.get_active_policies",
        [&] { return insurance_.get_active_policies(owner); });
    const Amount monthly_premium = core::collaborator_call(
        "insurance.get_total_monthly_premium",
        [&] { return insurance_.get_total_monthly_premium(owner); });
    return reduce(policies, monthly_premium, period_start, period_end);
}

} // namespace finrep
