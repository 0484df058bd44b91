#pragma once

/// @file include/finrep/insurance.hpp
/// @brief Insurance Coverage Calculator.

#include "finrep/collaborators.hpp"
#include "finrep/reports.hpp"

#include <span>

namespace finrep {

/// Totals coverage over active policies and relates it to the yearly premium.
///
/// Active policies and the monthly premium total come from two separate
/// collaborator calls and are not reconciled. Period bounds are echoed only.
class InsuranceCoverageCalculator {
public:
    explicit InsuranceCoverageCalculator(const InsuranceService& insurance) noexcept
        : insurance_(insurance) {}

    [[nodiscard]] InsuranceReport report(const Identity& owner,
                                         Timestamp period_start,
                                         Timestamp period_end) const;

    /// `annual_premium = monthly_premium * 12`;
    /// ratio = `total_coverage * 100 / annual_premium` truncated and
    /// saturated to uint32, or 0 when `annual_premium <= 0`.
    [[nodiscard]] static InsuranceReport
    reduce(std::span<const InsurancePolicy> active_policies,
           Amount monthly_premium,
           Timestamp period_start,
           Timestamp period_end);

private:
    const InsuranceService& insurance_;
};

} // namespace finrep
