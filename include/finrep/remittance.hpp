#pragma once

/// @file include/finrep/remittance.hpp
/// @brief Remittance Summary Generator and Category Breakdown Builder.
///
/// # Module: Remittance
///
/// ## Responsibility
/// Zip the split collaborator's percentage vector and amount vector into a
/// fixed four-entry category breakdown, and wrap it with the caller-supplied
/// total and period bounds.
///
/// ## Edge Cases
/// - Upstream vectors shorter than four entries: missing amount and
///   percentage default to 0. Extra entries are ignored.
/// - Period bounds are echoed, never validated.
/// - `total_allocated` is reported equal to `total_received`; the engine
///   assumes every received unit is allocated.

#include "finrep/collaborators.hpp"
#include "finrep/constants.hpp"
#include "finrep/reports.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace finrep {

class RemittanceSummaryGenerator {
public:
    using Breakdown = std::array<CategoryBreakdown, constants::CATEGORY_COUNT>;

    explicit RemittanceSummaryGenerator(const RemittanceSplitService& split) noexcept
        : split_(split) {}

    /// Query the split collaborator (two calls) and build the summary.
    ///
    /// # Throws
    /// `ReportingError{CollaboratorFailure}` if either call fails.
    [[nodiscard]] RemittanceSummary summarize(Amount total_amount,
                                              Timestamp period_start,
                                              Timestamp period_end) const;

    /// Pair percentages and amounts by index in `constants::CATEGORY_ORDER`.
    [[nodiscard]] static Breakdown
    build_breakdown(std::span<const std::uint32_t> percentages,
                    std::span<const Amount> amounts) noexcept;

private:
    const RemittanceSplitService& split_;
};

} // namespace finrep
