#pragma once

#include "finrep/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

/// @file include/finrep/constants.hpp
/// @brief Scoring weights and reporting defaults.
///
/// Changing any value here changes every score the engine has ever produced
/// for the same inputs. Stored reports are not recomputed.

namespace finrep::constants {

// ─── Categories ───────────────────────────────────────────────────────────────

/// Number of remittance categories. Upstream split vectors are indexed 0..3.
static constexpr std::size_t CATEGORY_COUNT = 4;

/// Fixed breakdown order.
static constexpr std::array<Category, CATEGORY_COUNT> CATEGORY_ORDER = {
    Category::Spending,
    Category::Savings,
    Category::Bills,
    Category::Insurance,
};

// ─── Ratios ───────────────────────────────────────────────────────────────────

/// Scale for every percentage and ratio the engine reports.
static constexpr std::int64_t PERCENT_SCALE = 100;

/// Premium annualisation factor.
static constexpr std::int64_t MONTHS_PER_YEAR = 12;

/// Compliance reported when the period holds no bills.
static constexpr std::uint32_t VACUOUS_COMPLIANCE_PERCENTAGE = 100;

/// Trend change reported for a move from zero to a positive amount.
static constexpr std::int32_t TREND_FROM_ZERO_PERCENTAGE = 100;

// ─── Health score weights ─────────────────────────────────────────────────────

/// Savings sub-score ceiling.
static constexpr std::uint32_t SAVINGS_SCORE_MAX = 40;

/// Savings sub-score when the owner has no positive savings target.
static constexpr std::uint32_t SAVINGS_SCORE_NO_GOALS = 20;

/// Bills sub-score with no unpaid bills.
static constexpr std::uint32_t BILLS_SCORE_CLEAR = 40;

/// Bills sub-score with unpaid bills, none overdue.
static constexpr std::uint32_t BILLS_SCORE_UNPAID = 35;

/// Bills sub-score with at least one overdue bill.
static constexpr std::uint32_t BILLS_SCORE_OVERDUE = 20;

/// Insurance sub-score with at least one active policy.
static constexpr std::uint32_t INSURANCE_SCORE_COVERED = 20;

/// Insurance sub-score with no active policy.
static constexpr std::uint32_t INSURANCE_SCORE_UNCOVERED = 0;

/// Upper bound of the composite score.
static constexpr std::uint32_t HEALTH_SCORE_MAX =
    SAVINGS_SCORE_MAX + BILLS_SCORE_CLEAR + INSURANCE_SCORE_COVERED;

static_assert(HEALTH_SCORE_MAX == 100, "health score weights must sum to 100");

// ─── Events ───────────────────────────────────────────────────────────────────

/// Topic attached to every event the engine publishes.
static constexpr const char* EVENT_TOPIC = "report";

} // namespace finrep::constants
