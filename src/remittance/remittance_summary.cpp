/// @file src/remittance/remittance_summary.cpp
/// @brief Remittance Summary Generator.

#include "finrep/remittance.hpp"

#include "../core/collaborator_call.hpp"

#include <vector>

namespace finrep {

// ─── build_breakdown ──────────────────────────────────────────────────────────

RemittanceSummaryGenerator::Breakdown
RemittanceSummaryGenerator::build_breakdown(std::span<const std::uint32_t> percentages,
                                            std::span<const Amount> amounts) noexcept {
    Breakdown out{};
    for (std::size_t i = 0; i < constants::CATEGORY_COUNT; ++i) {
        out[i] = CategoryBreakdown{
            .category   = constants::CATEGORY_ORDER[i],
            .amount     = i < amounts.size() ? amounts[i] : Amount{0},
            .percentage = i < percentages.size() ? percentages[i] : 0u,
        };
    }
    return out;
}

// ─── summarize ────────────────────────────────────────────────────────────────

RemittanceSummary RemittanceSummaryGenerator::summarize(Amount total_amount,
                                                        Timestamp period_start,
                                                        Timestamp period_end) const {
    const std::vector<std::uint32_t> percentages = core::collaborator_call(
        "remittance_split.get_split", [&] { return split_.get_split(); });
    const std::vector<Amount> amounts = core::collaborator_call(
        "remittance_split.calculate_split",
        [&] { return split_.calculate_split(total_amount); });

    return RemittanceSummary{
        .total_received     = total_amount,
        .total_allocated    = total_amount,
        .category_breakdown = build_breakdown(percentages, amounts),
        .period_start       = period_start,
        .period_end         = period_end,
    };
}

} // namespace finrep
